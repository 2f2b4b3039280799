#define SOKOL_IMPL
#define SOKOL_GLCORE

#include "sokol_gfx.h"
