#include "GpsEmitter.hpp"

#include <chrono>
#include <csignal>
#include <stdexcept>

#include "utils/logger.hpp"


namespace Modules {

GpsEmitter::GpsEmitter(boost::asio::io_context& io_context,
                       const Config::Settings& settings,
                       Device::Transport& transport,
                       const Nmea::TimeSource& clock)
    : io_context_(io_context),
      m_Settings_(settings),
      m_Transport_(transport),
      m_Clock_(clock),
      m_Timer_(io_context),
      m_Signals_(io_context) {
    auto position = Nmea::Position::fromString(settings.where);
    if (!position) {
        throw std::runtime_error("Malformed position: " + settings.where);
    }
    m_Position_ = *position;
}


GpsEmitter::~GpsEmitter() {
    shutdown();
}


int GpsEmitter::run(void) {
    Logger* logger = Logger::getLoggerInst();

    if (m_StopRequested.load()) {
        // Drain the shutdown queued by stop()
        io_context_.restart();
        io_context_.poll();
        return m_Result_;
    }

    m_Running.store(true);
    m_Result_ = 0;

    boost::system::error_code ec;
    m_Signals_.add(SIGINT, ec);
    if (!ec) {
        m_Signals_.add(SIGTERM, ec);
    }
    if (ec) {
        logger->log(Logger::LOG_LVL_WARN, "Could not install signal handlers: %s\n", ec.message().c_str());
    }

    m_Signals_.async_wait([this](const boost::system::error_code& error, int signalNumber) {
        if (error) {
            return;
        }
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Caught signal %d, stopping\n", signalNumber);
        stop();
    });

    io_context_.restart();
    boost::asio::post(io_context_, [this]() { emitSentence(); });
    io_context_.run();

    return m_Result_;
}


void GpsEmitter::stop(void) {
    m_StopRequested.store(true);
    m_Running.store(false);
    boost::asio::post(io_context_, [this]() { shutdown(); });
}


void GpsEmitter::shutdown(void) {
    boost::system::error_code ec;
    m_Timer_.cancel();
    m_Signals_.cancel(ec);
    m_Signals_.clear(ec);
}


void GpsEmitter::emitSentence(void) {
    if (!m_Running.load()) {
        return;
    }

    const Nmea::Sentence sentence = Nmea::buildSentence(m_Clock_.now(), m_Position_);
    if (m_Settings_.verbose) {
        onSentence(sentence.text());
    }

    const std::string framed = sentence.framed();
    int ret = m_Transport_.writeData(framed.data(), framed.size());
    if (ret < 0 || static_cast<size_t>(ret) != framed.size()) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Failed to write sentence to %s\n",
                                     m_Transport_.getName().c_str());
        m_Result_ = -1;
        stop();
        return;
    }
    m_SentencesSent_++;

    if (!m_Settings_.loop) {
        stop();
        return;
    }

    scheduleNext();
}


void GpsEmitter::scheduleNext(void) {
    if (!m_Running.load()) {
        return;
    }

    m_Timer_.expires_after(std::chrono::seconds(m_Settings_.delay));
    m_Timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        emitSentence();
    });
}

} // namespace Modules
