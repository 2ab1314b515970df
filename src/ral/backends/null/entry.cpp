/// @file entry.cpp
/// @brief Module entry points of the null RAL backend

#include "null_ral.hpp"
#include <onca_engine/core/dynamic_library.hpp>
#include <exception>

extern "C" {

ONCA_EXPORT onca_ral::RalInterface* create_ral(const onca_ral::RalCreateInfo& create_info, onca_core::Error& error) {
    try {
        auto ral = onca_ral::null::NullRal::create(create_info);
        if (!ral) {
            error = ral.error();
            return nullptr;
        }
        return ral->release();
    } catch (const std::exception& e) {
        error = onca_core::Error(onca_core::RalError::other(std::string("Null RAL creation threw: ") + e.what()));
        return nullptr;
    }
}

ONCA_EXPORT void destroy_ral(onca_ral::RalInterface* ral) {
    delete ral;
}

} // extern "C"
