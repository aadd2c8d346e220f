#ifndef __SWAYIPC_JSON_LIB__
#define __SWAYIPC_JSON_LIB__

#include <nlohmann/json.hpp>

/**
 * @brief Reply and event payloads are JSON documents; the core only looks at
 * the `success` and `change` fields and leaves the rest to callers.
 */
using json = nlohmann::json;

#endif  // __SWAYIPC_JSON_LIB__
