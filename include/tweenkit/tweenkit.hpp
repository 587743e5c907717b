#pragma once

#include <tweenkit/config.hpp>
#include <tweenkit/easing.hpp>
#include <tweenkit/filters.hpp>
#include <tweenkit/fwd.hpp>
#include <tweenkit/hooks.hpp>
#include <tweenkit/logger.hpp>
#include <tweenkit/properties.hpp>
#include <tweenkit/scheduler.hpp>
#include <tweenkit/tween.hpp>
#include <tweenkit/tweenable.hpp>
