#pragma once

#include <string>
#include "lock_file.hpp"
#include "manifest.hpp"

class ClientFactory;

// Turns manifest dependencies into locked remote paths and digests.
class Resolver {
public:
    explicit Resolver(ClientFactory& clients) : clients_(clients) {}

    // Non-recursive: exactly the asset at the expanded path. Recursive: every
    // asset under the expanded prefix; zero assets is an error. Fails when an
    // asset publishes no digest for the dependency's algorithm.
    LockedFiles resolve(const Dependency& dep);

private:
    ClientFactory& clients_;
};
