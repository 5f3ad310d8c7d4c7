#pragma once
/**
 * @file
 *
 * Encoding of the application state for the primary save, the backup
 * chain and the state record of chunked backups.
 *
 * An encoded state is the magic `CHARXSAV`, a 32-bit little-endian
 * format version, the compression method framed like a backup record
 * field, and the JSON document compressed with that method.
 */

#include "charx/util/error.hh"

#include <nlohmann/json.hpp>

namespace charx {

/**
 * The application state is an opaque JSON document.
 */
typedef nlohmann::json StateObject;

MakeError(StateDecodeError, Error);

/**
 * @param compression A method understood by `compress()`: `br` or
 * `none`.
 */
std::string encodeState(const StateObject & state, const std::string & compression);

/**
 * Encode with the method named by the `state-compression` setting.
 */
std::string encodeState(const StateObject & state);

/**
 * @throws StateDecodeError if `data` is not an encoded state.
 */
StateObject decodeState(std::string_view data);

/**
 * Whether `data` starts like an encoded state. Cheap; does not
 * validate the payload.
 */
bool isEncodedState(std::string_view data);

} // namespace charx
