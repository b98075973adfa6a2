#pragma once
#include <stdexcept>
#include <string>

namespace roix
{
    struct Error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // Malformed caller input: empty buffer, bad rectangle, out-of-range parameter.
    struct InputError : Error
    {
        using Error::Error;
    };

    // No superpixel backend could serve the request.
    struct BackendUnavailable : Error
    {
        using Error::Error;
    };

    // A numerical routine failed in a way the caller must see.
    struct AlgorithmFailure : Error
    {
        using Error::Error;
    };
}
