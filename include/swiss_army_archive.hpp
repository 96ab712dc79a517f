#pragma once

#include "../src/error/error.hpp"
#include "../src/driver/driver.hpp"
#include "../src/status/status.hpp"
#include "../src/manifest/manifest.hpp"
#include "../src/digest/digest.hpp"
#include "../src/encoder/encoder.hpp"
#include "../src/decoder/decoder.hpp"
