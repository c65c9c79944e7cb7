#pragma once

namespace multidl {

inline const char* appVersion() {
#ifdef MULTIDL_APP_VERSION
    return MULTIDL_APP_VERSION;
#else
    return "0.0.0";
#endif
}

} // namespace multidl
