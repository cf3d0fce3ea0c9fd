#ifndef sandcell_CORE_JSON_HPP
#define sandcell_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace sandcell {

typedef nlohmann::json Json;

} // namespace sandcell

#endif // sandcell_CORE_JSON_HPP
