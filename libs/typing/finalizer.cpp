/**
 * @file finalizer.cpp
 * @brief Legalization of a chosen typing for emitted code
 */

#include "typmin/finalizer.hpp"

namespace typmin::typing {

std::size_t finalize_types(Typing& typing)
{
    std::size_t replaced = 0;
    for (const auto& local : typing.locals()) {
        const types::Type& type = typing.get(local);
        if (!type.is_allowed_in_final_code()) {
            typing.set(local, type.default_final_type());
            ++replaced;
        }
    }
    return replaced;
}

}  // namespace typmin::typing
