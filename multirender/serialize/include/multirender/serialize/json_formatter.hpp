#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace multirender {

/**
 * Formats JSON so that containers up to a nesting depth of `max_depth` are pretty printed
 * (one entry per line, indented by two spaces per level) while deeper containers are printed
 * on a single line with ", " between entries. Long paths and coordinate lists stay compact
 * while the overall structure of a document remains readable.
 *
 * A `max_depth` of zero prints the whole document on one line.
 */
std::string dump_json_depth_limited(const nlohmann::ordered_json& value, size_t max_depth);

} // namespace multirender
