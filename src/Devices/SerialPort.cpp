#include "SerialPort.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

#include "utils/logger.hpp"


using namespace Device;


SerialPort::SerialPort(const Settings& settings) : m_Settings_(settings) {
    if (openPort() < 0) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
        throw std::runtime_error("Failed to open serial port " + m_Settings_.devPath);
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Opened serial port %s (%d baud, parity %s, %d stop bit%s)\n",
                                 m_Settings_.devPath.c_str(), m_Settings_.baud,
                                 parityName(m_Settings_.parity), m_Settings_.stopBits,
                                 m_Settings_.stopBits == 1 ? "" : "s");
}


SerialPort::~SerialPort() {
    if (fd >= 0) {
        ::close(fd);
    }
}


std::optional<speed_t> SerialPort::toSpeed(int baud) {
    switch (baud) {
        case 50:      return B50;
        case 75:      return B75;
        case 110:     return B110;
        case 134:     return B134;
        case 150:     return B150;
        case 200:     return B200;
        case 300:     return B300;
        case 600:     return B600;
        case 1200:    return B1200;
        case 1800:    return B1800;
        case 2400:    return B2400;
        case 4800:    return B4800;
        case 9600:    return B9600;
        case 19200:   return B19200;
        case 38400:   return B38400;
        case 57600:   return B57600;
        case 115200:  return B115200;
        case 230400:  return B230400;
        case 460800:  return B460800;
        case 500000:  return B500000;
        case 576000:  return B576000;
        case 921600:  return B921600;
        case 1000000: return B1000000;
        case 1152000: return B1152000;
        case 1500000: return B1500000;
        case 2000000: return B2000000;
        case 2500000: return B2500000;
        case 3000000: return B3000000;
        case 3500000: return B3500000;
        case 4000000: return B4000000;
        default:      return std::nullopt;
    }
}


std::optional<SerialPort::Parity> SerialPort::parseParity(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowered == "none"  || lowered == "n") return Parity::None;
    if (lowered == "even"  || lowered == "e") return Parity::Even;
    if (lowered == "odd"   || lowered == "o") return Parity::Odd;
    if (lowered == "mark"  || lowered == "m") return Parity::Mark;
    if (lowered == "space" || lowered == "s") return Parity::Space;
    return std::nullopt;
}


const char* SerialPort::parityName(Parity parity) {
    switch (parity) {
        case Parity::None:  return "none";
        case Parity::Even:  return "even";
        case Parity::Odd:   return "odd";
        case Parity::Mark:  return "mark";
        case Parity::Space: return "space";
    }
    return "unknown";
}


/**
 * @brief Open and configure the tty
 *
 * Raw output, 8 data bits, no flow control.
 *
 * @return int 0 on success, -1 on failure
 */
int SerialPort::openPort(void) {
    Logger* logger = Logger::getLoggerInst();

    auto speed = toSpeed(m_Settings_.baud);
    if (!speed) {
        logger->log(Logger::LOG_LVL_ERROR, "%s: unsupported baud rate %d\n", m_Settings_.devPath.c_str(), m_Settings_.baud);
        return -1;
    }

    if (m_Settings_.stopBits != 1 && m_Settings_.stopBits != 2) {
        logger->log(Logger::LOG_LVL_ERROR, "%s: unsupported stop bits %d\n", m_Settings_.devPath.c_str(), m_Settings_.stopBits);
        return -1;
    }

    int flags = O_WRONLY | O_NOCTTY;
    fd = ::open(m_Settings_.devPath.c_str(), flags);
    if (fd < 0 && errno == EINTR) {
        // Retry if interrupted by signal
        fd = ::open(m_Settings_.devPath.c_str(), flags);
    }
    if (fd < 0) {
        logger->log(Logger::LOG_LVL_ERROR, "open %s: %s\n", m_Settings_.devPath.c_str(), strerror(errno));
        return -1;
    }

    termios options{};
    if (tcgetattr(fd, &options) != 0) {
        logger->log(Logger::LOG_LVL_ERROR, "tcgetattr %s: %s\n", m_Settings_.devPath.c_str(), strerror(errno));
        return -1;
    }

    cfsetispeed(&options, *speed);
    cfsetospeed(&options, *speed);

    options.c_cflag |= (CLOCAL | CREAD);  // Ignore modem control lines
    options.c_cflag &= ~CSIZE;
    options.c_cflag |= CS8;               // 8 data bits
    options.c_cflag &= ~CRTSCTS;          // No hardware flow control

    options.c_cflag &= ~(PARENB | PARODD | CMSPAR);
    switch (m_Settings_.parity) {
        case Parity::None:
            break;
        case Parity::Even:
            options.c_cflag |= PARENB;
            break;
        case Parity::Odd:
            options.c_cflag |= (PARENB | PARODD);
            break;
        case Parity::Mark:
            options.c_cflag |= (PARENB | CMSPAR | PARODD);
            break;
        case Parity::Space:
            options.c_cflag |= (PARENB | CMSPAR);
            break;
    }

    if (m_Settings_.stopBits == 2) {
        options.c_cflag |= CSTOPB;
    } else {
        options.c_cflag &= ~CSTOPB;
    }

    options.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);  // Raw input
    options.c_iflag &= ~(IXON | IXOFF | IXANY);          // No software flow control
    options.c_oflag &= ~OPOST;                           // Raw output

    if (tcsetattr(fd, TCSANOW, &options) != 0) {
        logger->log(Logger::LOG_LVL_ERROR, "tcsetattr %s: %s\n", m_Settings_.devPath.c_str(), strerror(errno));
        return -1;
    }
    return 0;
}


/**
 * @brief Write a buffer to the tty
 *
 * @param pBuf Data to write
 * @param length Number of bytes
 * @return int Number of bytes written, or -1 on error
 */
int SerialPort::writeData(const char* pBuf, size_t length) {
    if (fd < 0 || !pBuf) {
        return -1;
    }

    size_t written = 0;
    while (written < length) {
        ssize_t n = ::write(fd, pBuf + written, length - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "write %s: %s\n", m_Settings_.devPath.c_str(), strerror(errno));
            return -1;
        }
        if (n == 0) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "write %s: no progress\n", m_Settings_.devPath.c_str());
            return -1;
        }
        written += static_cast<size_t>(n);
    }
    return static_cast<int>(written);
}
