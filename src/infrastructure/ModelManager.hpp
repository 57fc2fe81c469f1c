/**
 * @file ModelManager.hpp
 * @brief Makes sure a model is present before a stage and evicts it afterwards.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "infrastructure/OllamaClient.hpp"

namespace webforge::infrastructure {

/**
 * @class ModelManager
 * @brief Separates model lifecycle policy from adapter I/O.
 *
 * Leases are reference counted per model so a model shared by two concurrent
 * runs is only unloaded when the last lease goes away.
 */
class ModelManager {
public:
    /** @brief Holds a model in memory for the duration of a stage. */
    class Lease {
    public:
        Lease(ModelManager& manager, std::string model);
        ~Lease();
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

    private:
        ModelManager& m_manager;
        std::string m_model;
    };

    ModelManager(std::shared_ptr<OllamaClient> client, bool unloadBetweenStages);

    /**
     * @brief Checks /api/tags and pulls the model when it is missing.
     * @return False when the model could not be made available; the call that
     *         follows will surface the real error.
     */
    bool Ensure(const std::string& model);

    /** @brief True when `model` (or its untagged base name) is listed. */
    static bool IsListed(const std::vector<std::string>& available, const std::string& model);

private:
    void Acquire(const std::string& model);
    void Release(const std::string& model);

    std::shared_ptr<OllamaClient> m_client;
    bool m_unloadBetweenStages;

    std::mutex m_mutex;
    std::set<std::string> m_known;
    std::map<std::string, int> m_leases;
};

} // namespace webforge::infrastructure
