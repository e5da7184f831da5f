#pragma once
/*
 * Base64 text form of byte arrays, used by the encoded byte array converter.
 *  - Base64_Encode: standard alphabet with '=' padding.
 *  - Base64_Decode: ignores CR/LF/space/tab, requires a sanitized length that is a multiple
 *    of 4 and only characters from the standard alphabet. Malformed input is logged through
 *    ARBOR_LOG_ERROR and reported through the return value.
 */
#include <string>
#include <vector>

#include "Logging.hpp"

namespace Arbor
{
    // Encodes a vector of bytes to a base64 string.
    ARBOR_API std::string Base64_Encode(const std::vector<unsigned char>& data);

    // Decodes a base64 string into `out`. Returns false (leaving `out` empty) on malformed input.
    ARBOR_API bool Base64_Decode(const std::string& data, std::vector<unsigned char>& out);
}
