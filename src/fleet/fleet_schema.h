#pragma once

#include <cstdint>
#include <string>

namespace YAML {
class Node;
}

namespace FleetLayout {

/**
 * Type of a YAML scalar under core schema resolution. Quoted scalars are
 * always strings; plain scalars are typed by their text, so "17" is an integer
 * and "3.2" a number. This is what lets a JSON document keep its types when it
 * is read through the YAML parser.
 */
enum class ScalarKind { NUL, BOOLEAN, INTEGER, NUMBER, STRING };

ScalarKind ClassifyScalar(const YAML::Node& node);

// True for scalars that hold a string: quoted scalars, scalars set from code
// (which carry no tag) and plain scalars that do not resolve to another type.
bool IsStringScalar(const YAML::Node& node);

// Reads an integer scalar. Returns false if "node" is not one or if it does
// not fit in 64 bits.
bool ScalarToInteger(const YAML::Node& node, int64_t* value);

/**
 * Validates a fleet description:
 *
 *   nshards:  integer in [1, 1024], required
 *   images:   object, optional
 *   servers:  non-empty array of objects, required, each with
 *       type:    "metadata" or "storage", required
 *       uuid:    non-empty string, required
 *       memory:  integer in [1, 1024] (gigabytes), required
 *       az:      non-empty string
 *       rack:    non-empty string
 *
 * No other properties are allowed. Stops at the first violation, describes it
 * in "error" and returns false.
 */
bool ValidateFleetSchema(const YAML::Node& root, std::string* error);

} // namespace FleetLayout
