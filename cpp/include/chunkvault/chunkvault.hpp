#pragma once

#include "chunkvault/chunker.hpp"
#include "chunkvault/codec.hpp"
#include "chunkvault/compression.hpp"
#include "chunkvault/config.hpp"
#include "chunkvault/constants.hpp"
#include "chunkvault/crypto.hpp"
#include "chunkvault/envelope.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fileio.hpp"
#include "chunkvault/manifest.hpp"
#include "chunkvault/planner.hpp"
#include "chunkvault/progress.hpp"
#include "chunkvault/reassembler.hpp"
#include "chunkvault/store.hpp"
#include "chunkvault/transform_cache.hpp"
