#pragma once

#include "subtext/Pattern.hh"
#include "subtext/Regex.hh"
#include "subtext/Span.hh"
#include "subtext/Types.hh"
