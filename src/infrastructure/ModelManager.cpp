#include "infrastructure/ModelManager.hpp"

#include <iostream>

namespace webforge::infrastructure {

namespace {
std::string BaseName(const std::string& model) {
    return model.substr(0, model.find(':'));
}
}

ModelManager::Lease::Lease(ModelManager& manager, std::string model)
    : m_manager(manager), m_model(std::move(model)) {
    m_manager.Acquire(m_model);
}

ModelManager::Lease::~Lease() {
    m_manager.Release(m_model);
}

ModelManager::ModelManager(std::shared_ptr<OllamaClient> client, bool unloadBetweenStages)
    : m_client(std::move(client)), m_unloadBetweenStages(unloadBetweenStages) {}

bool ModelManager::IsListed(const std::vector<std::string>& available, const std::string& model) {
    for (const auto& name : available) {
        if (name == model || BaseName(name) == BaseName(model)) return true;
    }
    return false;
}

bool ModelManager::Ensure(const std::string& model) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_known.count(model)) return true;
    }

    auto available = m_client->getAvailableModels();
    if (!available) return false;
    if (!IsListed(*available, model)) {
        std::cout << "[ModelManager] Pulling " << model << " (first use)..." << std::endl;
        if (!m_client->pullModel(model)) return false;
        std::cout << "[ModelManager] " << model << " ready" << std::endl;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_known.insert(model);
    return true;
}

void ModelManager::Acquire(const std::string& model) {
    if (!Ensure(model)) {
        std::cerr << "[ModelManager] Model " << model << " is not available yet" << std::endl;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_leases[model];
}

void ModelManager::Release(const std::string& model) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_leases.find(model);
        if (it == m_leases.end()) return;
        if (--it->second > 0) return;
        m_leases.erase(it);
    }
    if (m_unloadBetweenStages && m_client->unloadModel(model)) {
        std::cout << "[ModelManager] Unloaded " << model << std::endl;
    }
}

} // namespace webforge::infrastructure
