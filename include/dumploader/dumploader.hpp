#ifndef DUMPLOADER_HPP
#define DUMPLOADER_HPP

// Project version
#define DUMPLOADER_VERSION_MAJOR 0
#define DUMPLOADER_VERSION_MINOR 3
#define DUMPLOADER_VERSION_PATCH 0

#define DUMPLOADER_VERSION_STRING "0.3.0"

#include <dumploader/export.hpp>
#include <dumploader/enums.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/context.hpp>
#include <dumploader/manifest.hpp>
#include <dumploader/manifest_fetcher.hpp>
#include <dumploader/state_store.hpp>
#include <dumploader/planner.hpp>
#include <dumploader/transfer_engine.hpp>
#include <dumploader/run_summary.hpp>
#include <dumploader/config.hpp>
#include <dumploader/orchestrator.hpp>

#endif
