/*
 * FILE: engine_errors.cpp
 *
 * WHAT:
 * Lookup tables from `engine_error_t` to codes, messages and statuses.
 */

#include "engine_errors.h"

const char* engine_error_code(engine_error_t error)
{
    switch (error)
    {
    case ENGINE_OK:                              return "OK";
    case ENGINE_ERROR_LOAD:                      return "LoadError";
    case ENGINE_ERROR_INVALID_WORD:              return "InvalidWord";
    case ENGINE_ERROR_SESSION_NOT_FOUND:         return "SessionNotFound";
    case ENGINE_ERROR_SESSION_ALREADY_COMPLETED: return "SessionAlreadyCompleted";
    case ENGINE_ERROR_DUPLICATE_GUESS:           return "DuplicateGuess";
    case ENGINE_ERROR_PROVIDER:                  return "ProviderError";
    case ENGINE_ERROR_BAD_REQUEST:               return "BadRequest";
    case ENGINE_ERROR_NOT_FOUND:                 return "NotFound";
    case ENGINE_ERROR_CAPACITY:                  return "SessionCapacity";
    case ENGINE_ERROR_INTERNAL:                  return "InternalError";
    }
    return "InternalError";
}

const char* engine_error_message(engine_error_t error)
{
    switch (error)
    {
    case ENGINE_OK:                              return "OK";
    case ENGINE_ERROR_LOAD:                      return "Vocabulary could not be loaded";
    case ENGINE_ERROR_INVALID_WORD:              return "Invalid word or word not in vocabulary";
    case ENGINE_ERROR_SESSION_NOT_FOUND:         return "Session not found";
    case ENGINE_ERROR_SESSION_ALREADY_COMPLETED: return "Game already completed";
    case ENGINE_ERROR_DUPLICATE_GUESS:           return "Word was already guessed in this game";
    case ENGINE_ERROR_PROVIDER:                  return "Embedding provider unavailable, try again";
    case ENGINE_ERROR_BAD_REQUEST:               return "Malformed request";
    case ENGINE_ERROR_NOT_FOUND:                 return "No such endpoint";
    case ENGINE_ERROR_CAPACITY:                  return "Too many active games, try again later";
    case ENGINE_ERROR_INTERNAL:                  return "Internal error";
    }
    return "Internal error";
}

int engine_error_http_status(engine_error_t error)
{
    switch (error)
    {
    case ENGINE_OK:                              return 200;
    case ENGINE_ERROR_INVALID_WORD:              return 400;
    case ENGINE_ERROR_BAD_REQUEST:               return 400;
    case ENGINE_ERROR_SESSION_NOT_FOUND:         return 404;
    case ENGINE_ERROR_NOT_FOUND:                 return 404;
    case ENGINE_ERROR_SESSION_ALREADY_COMPLETED: return 409;
    case ENGINE_ERROR_DUPLICATE_GUESS:           return 409;
    case ENGINE_ERROR_PROVIDER:                  return 503;
    case ENGINE_ERROR_CAPACITY:                  return 503;
    case ENGINE_ERROR_LOAD:                      return 500;
    case ENGINE_ERROR_INTERNAL:                  return 500;
    }
    return 500;
}

bool engine_error_is_retryable(engine_error_t error)
{
    return error == ENGINE_ERROR_PROVIDER || error == ENGINE_ERROR_CAPACITY;
}
