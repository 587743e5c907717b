#pragma once

namespace tweenkit
{

class Logger;
class Scheduler;
class TimerQueue;
class ManualScheduler;
class LoopScheduler;
class EasingRegistry;
class HookRegistry;
class FilterRegistry;
class Tween;
class Tweenable;

struct EngineOptions;
struct Filter;
struct TweenConfig;
struct RunParameters;
struct RunState;

}   // namespace tweenkit
