#pragma once

/**
 * @file event_decoder.h
 * @brief Tagged text line -> Event
 *
 * Protocol, one event per line (anything before the tag is ignored):
 * @code
 * [Output] [Blue Button 'Start' id=start at=40,40 size=120x48 pulse]
 * [Output] [white Panel 'Logo' image=assets/logo.png]
 * [Output] 42
 * [Output] hello world
 * [Animation] {"target":"start","property":"color","value":"red","duration":0.3}
 * [RegisterEvent] start click
 * [RegisterEvent] start hover [{"property":"scale","value":1.2,"duration":0.2}]
 * @endcode
 *
 * A malformed payload rejects only its own line. The decoder never throws
 * for bad input; the reason is returned and logged.
 */

#include <glint/event.h>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace glint {

struct DecodeResult {
    std::optional<Event> event;  ///< Empty for blank or rejected lines
    std::string error;           ///< Non-empty when the line was rejected

    bool ok() const { return error.empty(); }
};

class EventDecoder {
public:
    DecodeResult decode(const std::string& line);

    /// Restart "output-N" numbering (scene reset)
    void resetIds() { m_nextOutputId = 1; }

    size_t failureCount() const { return m_failures; }

private:
    DecodeResult decodeOutput(const std::string& payload);
    DecodeResult decodeAnimation(const std::string& payload);
    DecodeResult decodeRegisterEvent(const std::string& payload);
    DecodeResult reject(const std::string& line, const std::string& reason);

    int m_nextOutputId = 1;
    size_t m_failures = 0;
};

/**
 * @brief Convert one animation record
 * @param record JSON object with target/property/value/duration[/easing]
 * @param defaultTarget Used when the record has no "target" (reactions)
 * @param error Receives the reason on failure
 */
std::optional<AnimateEvent> parseAnimationRecord(const nlohmann::json& record,
                                                 const std::string& defaultTarget,
                                                 std::string& error);

/// Parse a whole-string finite decimal number ("." separator in every locale, no hex)
std::optional<double> parseFiniteNumber(const std::string& text);

} // namespace glint
