#pragma once

#include <optional>
#include <string>

#include <termios.h>

#include "Transport.hpp"

namespace Device
{
class SerialPort : public Transport {
public:
    enum class Parity {
        None,
        Even,
        Odd,
        Mark,
        Space
    };

    struct Settings {
        std::string devPath;
        int baud = 4800;
        Parity parity = Parity::None;
        int stopBits = 1;
    };

    explicit SerialPort(const Settings& settings);
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    int writeData(const char* pBuf, size_t length) override;

    const std::string& getName() const override {
        return m_Settings_.devPath;
    }

    static std::optional<speed_t> toSpeed(int baud);
    static std::optional<Parity> parseParity(const std::string& name);
    static const char* parityName(Parity parity);

private:
    int openPort(void);

    Settings m_Settings_;
    int fd = -1;  // File descriptor for the tty
};
} // namespace Device::
