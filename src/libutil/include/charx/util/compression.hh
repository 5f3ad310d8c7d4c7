#pragma once
/**
 * @file
 *
 * The compression methods an encoded state may name: `br` (brotli) and
 * `none`. An empty method name means `none`.
 */

#include "charx/util/serialise.hh"

#include <memory>
#include <string>

namespace charx {

MakeError(UnknownCompressionMethod, Error);

MakeError(CompressionError, Error);

/**
 * A sink that compresses into `nextSink`. `finish()` flushes the end
 * of the stream.
 *
 * @throws UnknownCompressionMethod
 */
std::unique_ptr<FinishSink> makeCompressionSink(const std::string & method, Sink & nextSink);

/**
 * The inverse of `makeCompressionSink()`. `finish()` throws
 * `CompressionError` if the stream ended early.
 *
 * @throws UnknownCompressionMethod
 */
std::unique_ptr<FinishSink> makeDecompressionSink(const std::string & method, Sink & nextSink);

std::string compress(const std::string & method, std::string_view in);

std::string decompress(const std::string & method, std::string_view in);

} // namespace charx
