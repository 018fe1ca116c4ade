// Sniper Taker Engine
// Prediction-market taker pipeline: valuation, detection, risk gating and
// serialized on-chain execution.

#pragma once

#include <sniper/clock.hpp>
#include <sniper/config.hpp>
#include <sniper/detector.hpp>
#include <sniper/engine.hpp>
#include <sniper/errors.hpp>
#include <sniper/events.hpp>
#include <sniper/feed.hpp>
#include <sniper/gas.hpp>
#include <sniper/log.hpp>
#include <sniper/market.hpp>
#include <sniper/math.hpp>
#include <sniper/normalizer.hpp>
#include <sniper/pipeline.hpp>
#include <sniper/risk.hpp>
#include <sniper/rpc.hpp>
#include <sniper/scheduler.hpp>
#include <sniper/signer.hpp>
#include <sniper/types.hpp>
#include <sniper/valuation.hpp>
