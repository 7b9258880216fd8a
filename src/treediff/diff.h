#ifndef TREEDIFF_DIFF_H
#define TREEDIFF_DIFF_H

#include <treediff/diff/apply.h>
#include <treediff/diff/compute.h>
#include <treediff/diff/encoding.h>
#include <treediff/diff/types.h>

#endif
