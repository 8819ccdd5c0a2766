#pragma once

// Raylib include shim.
//
// Some C++ toolchains error if <raylib.h> is included before <cstdio>/<stdio.h>
// (raylib issue #3747). This shim always includes <cstdarg> and <cstdio> first.
//
// Use this header instead of including raylib.h directly.

#include <cstdarg>
#include <cstdio>

// raylib.h already provides extern "C" guards for C++.
#include <raylib.h>
