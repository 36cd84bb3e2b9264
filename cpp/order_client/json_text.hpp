#pragma once
#include <string>

namespace order_client {

/**
 * Re-layout JSON text without re-encoding it.
 *
 * Only whitespace outside string literals changes: key order, number
 * spelling and string escapes stay exactly as received. indent == 0 gives
 * a single line ("," and ":" with no spaces); indent > 0 puts one member
 * per line with ": " after keys. Empty objects and arrays stay "{}" / "[]".
 * Input is expected to be valid JSON.
 */
std::string format_json_text(const std::string& text, int indent);

} // namespace order_client
