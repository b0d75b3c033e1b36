// ============================================================================
// SCRIPT CODEC - Script ⇄ funscript JSON
// ============================================================================

#ifndef SCRIPT_CODEC_H
#define SCRIPT_CODEC_H

#include <string>
#include "pattern/Script.h"

namespace ScriptCodec {

std::string serialize(const Script& script);

/**
 * Parse a funscript document
 * Requires an "actions" array of {pos, at} integers; metadata is optional.
 * @return false on malformed input (out untouched)
 */
bool parse(const std::string& json, Script& out, std::string& errorMsg);

} // namespace ScriptCodec

#endif // SCRIPT_CODEC_H
