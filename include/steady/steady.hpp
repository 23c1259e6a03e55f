#pragma once
#include <steady/version.hpp>

#include <steady/core/log.hpp>
#include <steady/core/contract.hpp>
#include <steady/core/subscription.hpp>
#include <steady/core/composite_subscription.hpp>
#include <steady/core/observable.hpp>
#include <steady/core/pipeline.hpp>
#include <steady/core/sources.hpp>
#include <steady/core/result.hpp>
#include <steady/core/scheduler.hpp>
#include <steady/core/thread_pool.hpp>
#include <steady/core/subject.hpp>

#include <steady/ops/map.hpp>
#include <steady/ops/filter.hpp>
#include <steady/ops/start_with.hpp>
#include <steady/ops/observe_on.hpp>
#include <steady/ops/distinct.hpp>
#include <steady/ops/pairwise.hpp>
#include <steady/ops/scan.hpp>
#include <steady/ops/seed_first.hpp>
#include <steady/ops/take.hpp>
#include <steady/ops/combine_latest.hpp>
#include <steady/ops/zip.hpp>
#include <steady/ops/switch_map.hpp>

#include <steady/property/value_cell.hpp>
#include <steady/property/distributor.hpp>
#include <steady/property/property.hpp>
#include <steady/property/combinators.hpp>
