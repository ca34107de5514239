#ifndef SPARKBRIDGE_UTILS_HPP
#define SPARKBRIDGE_UTILS_HPP

#include "utils/traits.hpp"
#include "utils/function_signature.hpp"
#include "utils/ptr_cast.hpp"
#include "utils/match.hpp"
#include "utils/serde.hpp"
#include "utils/span.hpp"

#include "utils/macros.hpp"

#endif //SPARKBRIDGE_UTILS_HPP
