#pragma once

#include "tokensnap/config.hpp"
#include "tokensnap/diff.hpp"
#include "tokensnap/format.hpp"
#include "tokensnap/normalize.hpp"
#include "tokensnap/patch.hpp"
#include "tokensnap/printer.hpp"
#include "tokensnap/settings.hpp"
#include "tokensnap/snapshot.hpp"
#include "tokensnap/syntax.hpp"
#include "tokensnap/tokens.hpp"
#include "tokensnap/utils.hpp"
