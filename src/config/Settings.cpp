#include "Settings.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <type_traits>
#include <getopt.h>

#include <nlohmann/json.hpp>

#include "Devices/SerialPort.hpp"
#include "nmea/sentence.hpp"
#include "nmea/time_spec.hpp"
#include "utils/logger.hpp"
#include "version.h"


namespace Config {

namespace {
enum {
    OPT_PARITY = 256,
    OPT_STOPBITS,
};

const struct option longOptions[] = {
    {"delay",    required_argument, nullptr, 'd'},
    {"port",     required_argument, nullptr, 'p'},
    {"verbose",  no_argument,       nullptr, 'v'},
    {"quiet",    no_argument,       nullptr, 'q'},
    {"no-verbose", no_argument,     nullptr, 'q'},
    {"time",     required_argument, nullptr, 't'},
    {"loop",     no_argument,       nullptr, 'l'},
    {"once",     no_argument,       nullptr, '1'},
    {"no-loop",  no_argument,       nullptr, '1'},
    {"baudrate", required_argument, nullptr, 'b'},
    {"parity",   required_argument, nullptr, OPT_PARITY},
    {"stopbits", required_argument, nullptr, OPT_STOPBITS},
    {"where",    required_argument, nullptr, 'w'},
    {"config",   required_argument, nullptr, 'c'},
    {"help",     no_argument,       nullptr, 'h'},
    {"version",  no_argument,       nullptr, 'V'},
    {nullptr, 0, nullptr, 0}
};

const char* shortOptions = "d:p:vqt:l1b:w:c:hV";

bool parseInt(const char* str, int& out) {
    char* endptr = nullptr;
    errno = 0;
    long val = std::strtol(str, &endptr, 10);
    if (endptr == str || *endptr != '\0' || errno == ERANGE || val < INT_MIN || val > INT_MAX) {
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

template<typename T>
int readKey(const nlohmann::json& root, const char* key, T& out) {
    if (!root.contains(key)) {
        return 0;
    }

    const auto& value = root[key];
    bool typeOk = false;
    if constexpr (std::is_same<T, bool>::value) {
        typeOk = value.is_boolean();
    } else if constexpr (std::is_same<T, int>::value) {
        typeOk = value.is_number_integer();
    } else {
        typeOk = value.is_string();
    }

    if (!typeOk) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Config key \"%s\" has the wrong type\n", key);
        return -1;
    }

    if constexpr (std::is_same<T, int>::value) {
        const bool inRange = value.is_number_unsigned()
            ? value.get<uint64_t>() <= static_cast<uint64_t>(INT_MAX)
            : (value.get<int64_t>() >= INT_MIN && value.get<int64_t>() <= INT_MAX);
        if (!inRange) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Config key \"%s\" is out of range\n", key);
            return -1;
        }
        out = static_cast<int>(value.get<int64_t>());
    } else {
        out = value.get<T>();
    }
    return 0;
}
}


int loadSettingsJson(const std::string& jsonStr, Settings& settings) {
    Logger* logger = Logger::getLoggerInst();

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error& e) {
        logger->log(Logger::LOG_LVL_ERROR, "Config is not valid JSON: %s\n", e.what());
        return -1;
    }

    if (!root.is_object()) {
        logger->log(Logger::LOG_LVL_ERROR, "Config must be a JSON object\n");
        return -1;
    }

    static const char* knownKeys[] = {
        "delay", "port", "verbose", "time", "loop", "baudrate", "parity", "stopbits", "where"
    };
    for (const auto& item : root.items()) {
        bool known = false;
        for (const char* key : knownKeys) {
            if (item.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            logger->log(Logger::LOG_LVL_WARN, "Ignoring unknown config key \"%s\"\n", item.key().c_str());
        }
    }

    int ret = 0;
    ret |= readKey(root, "delay",    settings.delay);
    ret |= readKey(root, "port",     settings.port);
    ret |= readKey(root, "verbose",  settings.verbose);
    ret |= readKey(root, "time",     settings.time);
    ret |= readKey(root, "loop",     settings.loop);
    ret |= readKey(root, "baudrate", settings.baudrate);
    ret |= readKey(root, "parity",   settings.parity);
    ret |= readKey(root, "stopbits", settings.stopbits);
    ret |= readKey(root, "where",    settings.where);
    return ret == 0 ? 0 : -1;
}


int loadSettingsFile(const std::string& path, Settings& settings) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Failed to open config file: %s\n", path.c_str());
        return -1;
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (loadSettingsJson(contents, settings) < 0) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Failed to load config file: %s\n", path.c_str());
        return -1;
    }

    settings.configPath = path;
    return 0;
}


int parseCommandLine(int argc, char* argv[], Settings& settings) {
    Logger* logger = Logger::getLoggerInst();

    // First pass: only pick up --config so the file sits below the command line
    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, shortOptions, longOptions, nullptr)) != -1) {
        if (opt == 'c') {
            if (loadSettingsFile(optarg, settings) < 0) {
                return PARSE_ERROR;
            }
        }
    }

    optind = 0;
    opterr = 1;
    while ((opt = getopt_long(argc, argv, shortOptions, longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                if (!parseInt(optarg, settings.delay)) {
                    logger->log(Logger::LOG_LVL_ERROR, "Invalid delay: %s\n", optarg);
                    return PARSE_ERROR;
                }
                break;
            case 'p':
                settings.port = optarg;
                break;
            case 'v':
                settings.verbose = true;
                break;
            case 'q':
                settings.verbose = false;
                break;
            case 't':
                settings.time = optarg;
                break;
            case 'l':
                settings.loop = true;
                break;
            case '1':
                settings.loop = false;
                break;
            case 'b':
                if (!parseInt(optarg, settings.baudrate)) {
                    logger->log(Logger::LOG_LVL_ERROR, "Invalid baud rate: %s\n", optarg);
                    return PARSE_ERROR;
                }
                break;
            case OPT_PARITY:
                settings.parity = optarg;
                break;
            case OPT_STOPBITS:
                if (!parseInt(optarg, settings.stopbits)) {
                    logger->log(Logger::LOG_LVL_ERROR, "Invalid stop bits: %s\n", optarg);
                    return PARSE_ERROR;
                }
                break;
            case 'w':
                settings.where = optarg;
                break;
            case 'c':
                break;
            case 'h':
                printUsage(argv[0]);
                return PARSE_EXIT;
            case 'V':
                std::cout << "gps-emulator " << GPSEMU_VERSION_MAJOR << "." << GPSEMU_VERSION_MINOR
                          << "." << GPSEMU_VERSION_BUILD << std::endl;
                return PARSE_EXIT;
            default:
                printUsage(argv[0]);
                return PARSE_ERROR;
        }
    }

    if (optind < argc) {
        logger->log(Logger::LOG_LVL_ERROR, "Unexpected argument: %s\n", argv[optind]);
        return PARSE_ERROR;
    }

    return PARSE_OK;
}


int validate(const Settings& settings) {
    Logger* logger = Logger::getLoggerInst();
    int ret = 0;

    if (settings.delay < 0) {
        logger->log(Logger::LOG_LVL_ERROR, "delay must not be negative: %d\n", settings.delay);
        ret = -1;
    }

    if (settings.port.empty()) {
        logger->log(Logger::LOG_LVL_ERROR, "port must not be empty\n");
        ret = -1;
    }

    if (!Device::SerialPort::toSpeed(settings.baudrate)) {
        logger->log(Logger::LOG_LVL_ERROR, "Unsupported baudrate: %d\n", settings.baudrate);
        ret = -1;
    }

    if (!Device::SerialPort::parseParity(settings.parity)) {
        logger->log(Logger::LOG_LVL_ERROR, "Unsupported parity: %s\n", settings.parity.c_str());
        ret = -1;
    }

    if (settings.stopbits != 1 && settings.stopbits != 2) {
        logger->log(Logger::LOG_LVL_ERROR, "Unsupported stopbits: %d\n", settings.stopbits);
        ret = -1;
    }

    if (!Nmea::parseTimeSpec(settings.time)) {
        logger->log(Logger::LOG_LVL_ERROR, "Malformed time: \"%s\" (expected now, HH:MM[:SS] or YYYY-MM-DD HH:MM[:SS])\n",
                    settings.time.c_str());
        ret = -1;
    }

    if (!Nmea::Position::fromString(settings.where)) {
        logger->log(Logger::LOG_LVL_ERROR, "Malformed position: \"%s\" (expected lat,N|S,lon,E|W)\n",
                    settings.where.c_str());
        ret = -1;
    }

    return ret;
}


void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [options]\n"
              << "  -d, --delay N        seconds between sentences (default 1)\n"
              << "  -p, --port PATH      serial port (default " GPSEMU_DEFAULT_PORT ")\n"
              << "  -v, --verbose        echo each sentence to the console\n"
              << "  -q, --quiet          do not echo sentences (alias --no-verbose)\n"
              << "  -t, --time SPEC      now | HH:MM[:SS] | YYYY-MM-DD HH:MM[:SS] (default now)\n"
              << "  -l, --loop           emit forever (default)\n"
              << "  -1, --once           emit a single sentence and exit\n"
              << "  -b, --baudrate N     baud rate (default 4800)\n"
              << "      --parity P       none|even|odd|mark|space (default none)\n"
              << "      --stopbits N     1 or 2 (default 1)\n"
              << "  -w, --where POS      position fields (default " GPSEMU_DEFAULT_POSITION ")\n"
              << "  -c, --config FILE    JSON file with the same keys as the long options\n"
              << "  -h, --help           show this help\n"
              << "  -V, --version        show the version\n";
}


void logSettings(const Settings& settings) {
    Logger* logger = Logger::getLoggerInst();
    if (!settings.configPath.empty()) {
        logger->log(Logger::LOG_LVL_INFO, "Config file: %s\n", settings.configPath.c_str());
    }
    logger->log(Logger::LOG_LVL_INFO, "Port %s, %d baud, parity %s, %d stop bits\n",
                settings.port.c_str(), settings.baudrate, settings.parity.c_str(), settings.stopbits);
    logger->log(Logger::LOG_LVL_INFO, "Time %s, position %s, delay %ds, %s\n",
                settings.time.c_str(), settings.where.c_str(), settings.delay,
                settings.loop ? "looping" : "single sentence");
}

} // namespace Config
