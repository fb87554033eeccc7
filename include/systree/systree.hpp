#pragma once

#include "archive.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "models.hpp"
#include "parse.hpp"
#include "stdlib.hpp"
#include "utils.hpp"
