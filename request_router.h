/*
 * FILE: request_router.h
 *
 * WHAT:
 * Maps a request (method, path with optional query, body) onto an engine
 * operation and renders the status code and JSON body of the response.
 *
 * ROUTES:
 * - GET  /                              -> liveness message
 * - GET  /api                           -> endpoint listing
 * - POST /api/game/new[?debug=true]     -> new session view
 * - POST /api/game/guess                -> guess result
 * - GET  /api/game/{id}[?debug=true]    -> session view
 * - GET  /api/words/validate/{word}     -> {valid, word}
 * - GET  /api/stats/{user_id}           -> stats summary
 * - POST /api/stats                     -> record a session for a user
 * Anything else is 404 NotFound.
 */

#pragma once
#ifndef REQUEST_ROUTER_H
#define REQUEST_ROUTER_H
#include "semantle_engine.h"
#include <string>

/*
 * STRUCT: route_response_t
 *
 * `status` is an HTTP status code; `body` is compact single-line JSON.
 */
typedef struct _route_response
{
    int status;
    std::string body;
} route_response_t;

/*
 * FUNCTION: route_request
 *
 * WHAT:
 * Dispatches one request. Errors never escape as return values: they are
 * rendered into `p_response` as `{error, message, retryable}` with the
 * status from `engine_error_http_status`.
 */
void route_request(semantle_engine_t* p_engine, const char* method, const char* target, const char* body,
    time_t now, route_response_t* p_response);

/*
 * FUNCTION: parse_request_line
 *
 * WHAT:
 * Splits a driver input line `METHOD PATH [BODY]` in place. `*pp_body`
 * points at the rest of the line after the path (possibly empty).
 *
 * RETURNS:
 * - false if the line has no method or no path.
 */
bool parse_request_line(char* line, char** pp_method, char** pp_target, char** pp_body);

/*
 * FUNCTION: percent_decode
 *
 * Decodes `%XX` escapes of a path segment into `p_out`.
 * Returns false on a malformed escape or if the result does not fit.
 */
bool percent_decode(const char* p_in, size_t in_length, char* p_out, size_t out_size);

#endif
