#ifndef TREEDIFF_CORE_H
#define TREEDIFF_CORE_H

#include <treediff/core/datetime.h>
#include <treediff/core/dynamic.h>
#include <treediff/core/exception.h>
#include <treediff/core/pattern.h>
#include <treediff/core/type_definitions.h>

#endif
