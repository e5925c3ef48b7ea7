#ifndef __DBRIDGE_JSON_LIB__
#define __DBRIDGE_JSON_LIB__

#include <nlohmann/json.hpp>

namespace dbridge {
/**
 * @brief Envelope payloads, response data and broadcast data are all
 * `nlohmann::json` documents.
 */
using json = nlohmann::json;
}  // namespace dbridge

#endif  // __DBRIDGE_JSON_LIB__
