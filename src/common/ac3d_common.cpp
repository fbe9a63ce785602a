//
// AC3D
//

#include "ac3d_common.h"

namespace AC3D {
#ifndef NDEBUG
    FILE *GlobalLogFile = nullptr;
#endif
    std::string GlobalLastError = "";
};
