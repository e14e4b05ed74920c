#pragma once
// Thin aggregator for the classification engine headers.

#include "tokenize.hpp"
#include "rule.hpp"
#include "filter.hpp"
#include "store.hpp"
#include "name_resolver.hpp"
