#pragma once

#include <cstdlib>
#include <string>
#include "debug/Log.hpp"
#include "helpers/Memory.hpp"

// git stuff
#ifndef GIT_COMMIT_HASH
#define GIT_COMMIT_HASH "?"
#endif
#ifndef GIT_BRANCH
#define GIT_BRANCH "?"
#endif
#ifndef GIT_COMMIT_MESSAGE
#define GIT_COMMIT_MESSAGE "?"
#endif

#ifndef RANDPAPER_VERSION
#define RANDPAPER_VERSION "?"
#endif
