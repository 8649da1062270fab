#pragma once

#include <string>

namespace ouroboros {

/**
 * Generation and validation of the stable operation ids
 * (x-ouroboros-id) used to address operations independently of
 * their path or name.
 */
class IdGenerator {
public:
    /**
     * Generate a random RFC 4122 version 4 UUID
     * @return Lower-case UUID string, e.g. "3f2b8c1e-9d4a-4f6b-8e2c-1a7d5b9c0e3f"
     */
    static std::string generateUuid();

    /**
     * Validate UUID format
     * @param id Candidate id
     * @return true if id is 36 characters of hex digits with dashes at the canonical positions
     */
    static bool isValidUuid(const std::string& id);
};

} // namespace ouroboros
