#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <string>


#define GPSEMU_DEFAULT_PORT     "/dev/ttyAMA0"
#define GPSEMU_DEFAULT_POSITION "5220.531,N,00011.797,E"


namespace Config {

struct Settings {
    int delay = 1;          // Seconds between sentences
    bool loop = true;       // Emit forever, or exactly once
    bool verbose = false;   // Echo each sentence to the console
    std::string port = GPSEMU_DEFAULT_PORT;
    int baudrate = 4800;
    std::string parity = "none";
    int stopbits = 1;
    std::string time = "now";
    std::string where = GPSEMU_DEFAULT_POSITION;

    std::string configPath;
};

enum {
    PARSE_OK   = 0,
    PARSE_EXIT = 1,   // --help or --version was handled
    PARSE_ERROR = -1
};

/**
 * @brief Parse the command line into settings
 *
 * A --config file is loaded before any other option is applied, so options
 * given on the command line always win over the file.
 *
 * @return int PARSE_OK, PARSE_EXIT or PARSE_ERROR
 */
int parseCommandLine(int argc, char* argv[], Settings& settings);

int loadSettingsFile(const std::string& path, Settings& settings);
int loadSettingsJson(const std::string& jsonStr, Settings& settings);

/**
 * @brief Reject settings the emitter cannot run with
 *
 * @return int 0 if valid, -1 otherwise (reason is logged)
 */
int validate(const Settings& settings);

void printUsage(const char* progName);
void logSettings(const Settings& settings);

} // namespace Config

#endif
