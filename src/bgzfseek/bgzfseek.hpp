#pragma once

#include "bgzf.hpp"
#include "BgzfError.hpp"
#include "BgzfReader.hpp"
#include "BlockCodec.hpp"
#include "BlockCursor.hpp"
#include "crc32.hpp"
#include "zlib.hpp"
