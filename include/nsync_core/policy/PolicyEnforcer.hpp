/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// nsync_core/policy/PolicyEnforcer.hpp
#pragma once

#include <map>
#include <optional>
#include <string>

/// Identity of the caller of an engine operation.
struct RequestContext
{
    std::string tenantId;
    bool isAdmin = false;
};

/**
 * @brief Resource an authorization decision is about.
 *
 * networkTenantId is the owner of the network a port lives on, used by rules that let a
 * network owner act on other tenants' ports.
 */
struct PolicyTarget
{
    std::string tenantId;
    std::optional<std::string> networkTenantId;
};

namespace policy_action
{
inline const std::string PROVIDER_NETWORK_VIEW = "extension:provider_network:view";
inline const std::string PROVIDER_NETWORK_SET = "extension:provider_network:set";
inline const std::string PORT_SECURITY_CREATE = "create_port:port_security_enabled";
inline const std::string PORT_SECURITY_UPDATE = "update_port:port_security_enabled";
} // namespace policy_action

/// Authorization facility consulted by the ReconciliationEngine.
class PolicyEnforcer
{
  public:
    virtual ~PolicyEnforcer() = default;

    /// @return whether @p ctx may see the attributes guarded by @p action.
    virtual bool checkView(const RequestContext& ctx,
                           const PolicyTarget& target,
                           const std::string& action) const = 0;

    /// @throws NotAuthorized when @p ctx may not perform @p action.
    virtual void enforceSet(const RequestContext& ctx,
                            const PolicyTarget& target,
                            const std::string& action) const = 0;
};

enum class PolicyRule
{
    ADMIN_ONLY,
    ADMIN_OR_OWNER,
    ADMIN_OR_NETWORK_OWNER,
    ANY
};

/// @return std::nullopt for names outside {admin_only, admin_or_owner, admin_or_network_owner, any}.
std::optional<PolicyRule> policyRuleFromString(const std::string& name);

/**
 * @brief Role based enforcer: every action maps to one PolicyRule.
 *
 * Provider network attributes are admin only, port security flags may be set by an admin or
 * the network owner, any other action requires admin or resource owner. The "policy" section
 * of the configuration overrides single actions.
 */
class RolePolicyEnforcer : public PolicyEnforcer
{
  public:
    RolePolicyEnforcer();

    /// @throws InvalidInput for an unknown rule name.
    explicit RolePolicyEnforcer(const std::map<std::string, std::string>& overrides);

    bool checkView(const RequestContext& ctx,
                   const PolicyTarget& target,
                   const std::string& action) const override;

    void enforceSet(const RequestContext& ctx,
                    const PolicyTarget& target,
                    const std::string& action) const override;

    PolicyRule ruleFor(const std::string& action) const;

  private:
    std::map<std::string, PolicyRule> m_rules;
};
