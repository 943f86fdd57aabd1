#pragma once

// Umbrella header

#include "gridwire/error.hpp"
#include "gridwire/config/codec.hpp"
#include "gridwire/buffer/slice.hpp"
#include "gridwire/frame/layout.hpp"
#include "gridwire/frame/frame.hpp"
#include "gridwire/fragment/message.hpp"
#include "gridwire/fragment/reassembler.hpp"
#include "gridwire/fragment/splitter.hpp"
#include "gridwire/stream/frame_accumulator.hpp"
#include "gridwire/pipeline/concepts.hpp"
#include "gridwire/pipeline/inbound.hpp"
#include "gridwire/digest.hpp"
