#pragma once

#include "bytes.hpp"
#include "error.hpp"
#include "io.hpp"
#include "reader.hpp"
#include "result.hpp"
#include "tools.hpp"
#include "types.hpp"
#include "writer.hpp"
