#ifndef CBBF2F6E_BB0E_4A22_B015_D967ED4C8CED
#define CBBF2F6E_BB0E_4A22_B015_D967ED4C8CED

#include <linalg.h>

namespace drawer {
using namespace linalg::aliases;
} // namespace drawer

#endif /* CBBF2F6E_BB0E_4A22_B015_D967ED4C8CED */
