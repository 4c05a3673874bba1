// Public header for the schemata library
#pragma once

#include "sc/value.h"
#include "sc/failure.h"
#include "sc/schema.h"
#include "sc/validate.h"
