#include "sentence.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>
#include <vector>


namespace Nmea {

std::optional<Position> Position::fromString(const std::string& str) {
    std::vector<std::string> fields;
    std::stringstream ss(str);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }

    // getline drops a trailing empty field
    if (!str.empty() && str.back() == ',') {
        fields.push_back("");
    }

    if (fields.size() != 4) {
        return std::nullopt;
    }

    return Position{fields[0], fields[1], fields[2], fields[3]};
}


std::string Position::toString() const {
    return latitude + "," + latitudeHemisphere + "," + longitude + "," + longitudeHemisphere;
}


std::string Sentence::framed() const {
    return text() + "\r\n";
}


std::string Sentence::text() const {
    return "$" + payload + "*" + checksumHex(checksum);
}


uint8_t checksum(const std::string& payload) {
    uint8_t cs = 0;
    for (char c : payload) {
        cs ^= static_cast<uint8_t>(c);
    }
    return cs;
}


std::string checksumHex(uint8_t checksum) {
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02x", checksum);
    return std::string(buf);
}


std::string formatTime(const Timestamp& ts) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d%02d%02d.000", ts.hour, ts.minute, ts.second);
    return std::string(buf);
}


std::string formatDate(const Timestamp& ts) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d%02d%02d", ts.day, ts.month, ts.year % 100);
    return std::string(buf);
}


/**
 * @brief Build a GPRMC sentence
 *
 * Speed and track are always 0.0, the magnetic variation is left empty and
 * the mode indicator is 'A'.
 *
 * @param ts UTC timestamp of the fix
 * @param position Position fields
 * @return Sentence
 */
Sentence buildSentence(const Timestamp& ts, const Position& position) {
    std::ostringstream ss;
    ss << GPSEMU_SENTENCE_HEADER << ","
       << formatTime(ts) << ","
       << "A,"                      // Status: active
       << position.toString() << ","
       << "0.0,"                    // Speed over ground
       << "0.0,"                    // Track
       << formatDate(ts) << ","
       << ","                       // Magnetic variation
       << "A";

    Sentence sentence;
    sentence.payload = ss.str();
    sentence.checksum = checksum(sentence.payload);
    return sentence;
}


int validateSentence(const std::string& text) {
    auto startChar = text.find('$');
    if (startChar == std::string::npos) {
        return -1;
    }

    auto asteriskPos = text.find('*', startChar);
    if (asteriskPos == std::string::npos || text.find('*', asteriskPos + 1) != std::string::npos) {
        return -1;
    }

    std::string messageChecksum = text.substr(asteriskPos + 1, 2);
    if (messageChecksum.length() != 2 ||
        !std::isxdigit(static_cast<unsigned char>(messageChecksum[0])) ||
        !std::isxdigit(static_cast<unsigned char>(messageChecksum[1]))) {
        return -1;
    }

    std::string rest = text.substr(asteriskPos + 3);
    if (rest != "" && rest != "\r\n" && rest != "\n") {
        return -1;
    }

    std::string payload = text.substr(startChar + 1, asteriskPos - startChar - 1);
    unsigned long received = std::stoul(messageChecksum, nullptr, 16);
    if (received != checksum(payload)) {
        return -2;
    }

    return 0;
}

} // namespace Nmea
