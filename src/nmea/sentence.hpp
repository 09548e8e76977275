#ifndef NMEA_SENTENCE_HPP
#define NMEA_SENTENCE_HPP

#include <cstdint>
#include <optional>
#include <string>


#define GPSEMU_SENTENCE_HEADER "GPRMC"


namespace Nmea {

/**
 * @brief UTC time of a fix, whole seconds only
 *
 * year holds the two-digit year (0-99).
 */
struct Timestamp {
    int hour   = 0;
    int minute = 0;
    int second = 0;
    int day    = 1;
    int month  = 1;
    int year   = 0;

    bool operator==(const Timestamp& other) const {
        return hour == other.hour && minute == other.minute && second == other.second &&
               day == other.day && month == other.month && year == other.year;
    }
};

/**
 * @brief Fixed position fields, copied verbatim into the sentence
 */
struct Position {
    std::string latitude;
    std::string latitudeHemisphere;
    std::string longitude;
    std::string longitudeHemisphere;

    /**
     * @brief Split "lat,H,lon,H" into its four fields
     *
     * The fields themselves are not interpreted.
     *
     * @param str Comma separated position
     * @return std::optional<Position> nullopt if str does not hold exactly four fields
     */
    static std::optional<Position> fromString(const std::string& str);

    std::string toString() const;
};

struct Sentence {
    std::string payload;   // Everything between '$' and '*'
    uint8_t checksum = 0;

    // "$<payload>*<cs>\r\n", as written to the wire
    std::string framed() const;

    // Framed sentence without the line terminator
    std::string text() const;
};

uint8_t checksum(const std::string& payload);
std::string checksumHex(uint8_t checksum);

std::string formatTime(const Timestamp& ts);
std::string formatDate(const Timestamp& ts);

Sentence buildSentence(const Timestamp& ts, const Position& position);

/**
 * @brief Check the framing and checksum of a received sentence
 *
 * @param text Sentence, with or without trailing CR/LF
 * @return int 0 on success, -1 if malformed, -2 on checksum mismatch
 */
int validateSentence(const std::string& text);

} // namespace Nmea

#endif
