// Public header for the schemaguard library
#pragma once

#include "sg/dictionary.h"
#include "sg/json.h"
#include "sg/proxy.h"
#include "sg/schema_resolver.h"
#include "sg/validate.h"
#include "sg/validator.h"
