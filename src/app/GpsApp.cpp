#include "GpsApp.hpp"

#include <memory>
#include <optional>
#include <stdexcept>

#include <boost/asio.hpp>

#include "config/Settings.hpp"
#include "Devices/SerialPort.hpp"
#include "Modules/GpsEmitter.hpp"
#include "nmea/time_spec.hpp"
#include "utils/logger.hpp"
#include "version.h"


/**
 * @brief Parse options, open the port and emit sentences
 *
 * @return int Process exit status: 0 on success, --help or --version,
 *         1 on a configuration, port or write error
 */
int runApp(int argc, char* argv[]) {
    Logger* logger = Logger::getLoggerInst();

    Config::Settings settings;
    int ret = Config::parseCommandLine(argc, argv, settings);
    if (ret == Config::PARSE_EXIT) {
        return 0;
    }
    if (ret < 0 || Config::validate(settings) < 0) {
        return 1;
    }

    logger->setDebugEnabled(settings.verbose);
    logger->log(Logger::LOG_LVL_INFO, "GPS emulator V%u.%u.%u\n", GPSEMU_VERSION_MAJOR, GPSEMU_VERSION_MINOR, GPSEMU_VERSION_BUILD);
    Config::logSettings(settings);

    // Both already checked by validate()
    const std::optional<Nmea::TimeSpec> timeSpec = Nmea::parseTimeSpec(settings.time);
    std::unique_ptr<Nmea::TimeSource> clock = Nmea::makeTimeSource(*timeSpec);

    Device::SerialPort::Settings serialSettings;
    serialSettings.devPath  = settings.port;
    serialSettings.baud     = settings.baudrate;
    serialSettings.parity   = *Device::SerialPort::parseParity(settings.parity);
    serialSettings.stopBits = settings.stopbits;

    std::unique_ptr<Device::SerialPort> serialPort;
    try {
        serialPort = std::make_unique<Device::SerialPort>(serialSettings);
    } catch (const std::runtime_error& e) {
        logger->log(Logger::LOG_LVL_ERROR, "%s\n", e.what());
        return 1;
    }

    boost::asio::io_context io_context;
    Modules::GpsEmitter emitter(io_context, settings, *serialPort, *clock);
    emitter.onSentence.connect([logger](const std::string& sentence) {
        logger->log(Logger::LOG_LVL_INFO, "%s\n", sentence.c_str());
    });

    ret = emitter.run();
    logger->log(Logger::LOG_LVL_DEBUG, "Sent %zu sentence(s)\n", emitter.sentencesSent());

    return (ret < 0) ? 1 : 0;
}
