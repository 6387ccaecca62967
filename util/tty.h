#pragma once

#include <cstdio>

/** Checks whether the stream is connected to a terminal. */
bool IsAtty(FILE* f) noexcept;
