#ifndef __SG_JSON_LIB__
#define __SG_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for fixture parsing.
 */
using json = nlohmann::json;

#endif  // __SG_JSON_LIB__
