#ifndef TINYROUTE_HPP
#define TINYROUTE_HPP

// Pipeline host
#include <tinyroute/http/server/application.hpp>
#include <tinyroute/http/server/context.hpp>
#include <tinyroute/http/server/middleware.hpp>

// Routing
#include <tinyroute/http/server/routing/router.hpp>
#include <tinyroute/http/server/routing/route.hpp>
#include <tinyroute/http/server/routing/path_matcher.hpp>
#include <tinyroute/http/server/routing/route_error.hpp>

// Logging
#include <tinyroute/util/logger.hpp>

#endif // TINYROUTE_HPP
