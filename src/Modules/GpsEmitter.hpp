#pragma once

#include <atomic>
#include <cstddef>
#include <string>

#include <boost/asio.hpp>
#include <boost/signals2.hpp>

#include "config/Settings.hpp"
#include "Devices/Transport.hpp"
#include "nmea/sentence.hpp"
#include "nmea/time_spec.hpp"


namespace Modules {

/**
 * @brief Writes a GPRMC sentence to the transport every `delay` seconds
 *
 * Everything runs on the caller's io_context. SIGINT/SIGTERM stop the loop
 * between two sentences.
 */
class GpsEmitter {
public:
    GpsEmitter(boost::asio::io_context& io_context,
               const Config::Settings& settings,
               Device::Transport& transport,
               const Nmea::TimeSource& clock);
    ~GpsEmitter();

    GpsEmitter(const GpsEmitter&) = delete;
    GpsEmitter& operator=(const GpsEmitter&) = delete;

    /**
     * @brief Emit until stopped, or once if looping is disabled
     *
     * @return int 0 on success, -1 if a transport write failed
     */
    int run(void);

    /**
     * @brief Stop after the sentence currently being written, if any
     *
     * A stop requested before run() makes run() return without emitting.
     */
    void stop(void);

    size_t sentencesSent(void) const {
        return m_SentencesSent_;
    }

    // Fired with the sentence (no CR/LF) before it is written, verbose mode only
    boost::signals2::signal<void(const std::string& sentence)> onSentence;

private:
    void emitSentence(void);
    void scheduleNext(void);
    void shutdown(void);

    boost::asio::io_context& io_context_;
    const Config::Settings& m_Settings_;
    Device::Transport& m_Transport_;
    const Nmea::TimeSource& m_Clock_;
    Nmea::Position m_Position_;

    boost::asio::steady_timer m_Timer_;
    boost::asio::signal_set m_Signals_;

    std::atomic<bool> m_Running{false};
    std::atomic<bool> m_StopRequested{false};
    size_t m_SentencesSent_ = 0;
    int m_Result_ = 0;
};

} // namespace Modules
