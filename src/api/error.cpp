#include "bastion/error.h"

namespace {

struct ErrcInfo {
    bastion_errc_t code;
    const char* name;
    const char* message;
};

constexpr ErrcInfo errc_infos[] = {
    {BASTION_OK, "OK", "no error"},
    {BASTION_ERROR_BAD_ARG, "ERROR_BAD_ARG", "invalid argument"},
    {BASTION_ERROR_BAD_MODULE, "ERROR_BAD_MODULE", "the module failed structural verification"},
    {BASTION_ERROR_MODULE_TOO_LARGE, "ERROR_MODULE_TOO_LARGE",
        "a table of the module exceeds the configured size limit"},
    {BASTION_ERROR_OUT_OF_BOUNDS, "ERROR_OUT_OF_BOUNDS", "a table index does not resolve"},
    {BASTION_ERROR_INTERNAL, "ERROR_INTERNAL", "an internal error occurred"},
};

const ErrcInfo* find_errc(bastion_errc_t e) {
    for (const auto& info : errc_infos) {
        if (info.code == e)
            return &info;
    }
    return nullptr;
}

} // namespace

const char* bastion_errc_name(bastion_errc_t e) {
    const auto* info = find_errc(e);
    return info ? info->name : "unknown error code";
}

const char* bastion_errc_message(bastion_errc_t e) {
    const auto* info = find_errc(e);
    return info ? info->message : "unknown error";
}
