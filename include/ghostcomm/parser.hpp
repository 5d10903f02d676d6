#pragma once

#include <string>
#include "ghostcomm/receiver.hpp"
#include "ghostcomm/volume.hpp"

namespace ghostcomm {
namespace parser {

/**
 * @brief Summary of one volume (header fields and payload length, no payload).
 * @return `{"type":"volume","media":"I","total":T,"index":N,"checksum":"...","symbols":L}`
 */
std::string volume_to_json(const Volume& v);

/**
 * @brief Serialize the outcome of Receiver::feed().
 * @return `{"type":"report","state":...,"have":H,"total":T,"accepted":...}`
 */
std::string report_to_json(const FeedReport& r);

/**
 * @brief Serialize one drained ReceiverEvent.
 * @return `{"type":"event","kind":...,"index":N,"total":T,"detail":...}`
 */
std::string receiver_event_to_json(const ReceiverEvent& ev);

/**
 * @brief Build a JSON string for a status event (error, ok, incomplete).
 * @return `{"type": type, "detail": detail}`
 */
std::string event_json(const std::string& type, const std::string& detail);

/**
 * @brief Extract the "type" field from a JSON string.
 * @return The value of "type", or an empty string if missing or the parse fails.
 */
std::string get_type(const std::string& jsonStr);

} // namespace parser
} // namespace ghostcomm
