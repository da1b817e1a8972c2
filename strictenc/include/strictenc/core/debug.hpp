/*
 * File: debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-03-02
 * License: MIT
 */


#pragma once

#ifndef STRICTENC_ASSERT
#include <cassert>
#define STRICTENC_ASSERT(cond, msg) do { static_cast<void>(msg); assert(cond); } while(0)
#endif
