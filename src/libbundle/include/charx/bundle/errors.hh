#pragma once
///@file

#include "charx/util/error.hh"

namespace charx {

/**
 * A container (archive, chunked backup or encoded state) is truncated
 * or cannot be parsed. Fatal to the attempt that read it.
 */
MakeError(StructuralError, Error);

/**
 * The container lacks its trailing `manifest.json`, which means it was
 * not written completely.
 */
MakeError(ManifestMissing, StructuralError);

/**
 * Every recovery tier failed.
 */
MakeError(CorruptionExhausted, Error);

} // namespace charx
