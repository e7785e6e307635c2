#ifndef VMXFER_VMXFER_HPP
#define VMXFER_VMXFER_HPP

// Project version
#define VMXFER_VERSION_MAJOR 0
#define VMXFER_VERSION_MINOR 1
#define VMXFER_VERSION_PATCH 0

// Binary version
#define VMXFER_BINARY_CURRENT 0
#define VMXFER_BINARY_REVISION 0
#define VMXFER_BINARY_AGE 1

#include <vmxfer/export.hpp>
#include <vmxfer/context.hpp>
#include <vmxfer/cancellation.hpp>
#include <vmxfer/checkpoint.hpp>
#include <vmxfer/checkpoint_session.hpp>
#include <vmxfer/config.hpp>
#include <vmxfer/fetcher.hpp>
#include <vmxfer/pool.hpp>
#include <vmxfer/rate_limiter.hpp>
#include <vmxfer/resume_planner.hpp>
#include <vmxfer/retry.hpp>
#include <vmxfer/session.hpp>

#endif
