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

#include "nsync_core/policy/PolicyEnforcer.hpp"
#include "common_types/Errors.hpp"
#include "utils/Logger.hpp"

std::optional<PolicyRule>
policyRuleFromString(const std::string& name)
{
    if (name == "admin_only")
    {
        return PolicyRule::ADMIN_ONLY;
    }
    if (name == "admin_or_owner")
    {
        return PolicyRule::ADMIN_OR_OWNER;
    }
    if (name == "admin_or_network_owner")
    {
        return PolicyRule::ADMIN_OR_NETWORK_OWNER;
    }
    if (name == "any")
    {
        return PolicyRule::ANY;
    }
    return std::nullopt;
}

RolePolicyEnforcer::RolePolicyEnforcer()
    : m_rules{{policy_action::PROVIDER_NETWORK_VIEW, PolicyRule::ADMIN_ONLY},
              {policy_action::PROVIDER_NETWORK_SET, PolicyRule::ADMIN_ONLY},
              {policy_action::PORT_SECURITY_CREATE, PolicyRule::ADMIN_OR_NETWORK_OWNER},
              {policy_action::PORT_SECURITY_UPDATE, PolicyRule::ADMIN_OR_NETWORK_OWNER}}
{
}

RolePolicyEnforcer::RolePolicyEnforcer(const std::map<std::string, std::string>& overrides)
    : RolePolicyEnforcer()
{
    for (const auto& [action, ruleName] : overrides)
    {
        auto rule = policyRuleFromString(ruleName);
        if (!rule)
        {
            throw InvalidInput("unknown policy rule '" + ruleName + "' for action " + action);
        }
        m_rules[action] = *rule;
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Policy override: {} -> {}", action, ruleName);
    }
}

PolicyRule
RolePolicyEnforcer::ruleFor(const std::string& action) const
{
    auto it = m_rules.find(action);
    return it == m_rules.end() ? PolicyRule::ADMIN_OR_OWNER : it->second;
}

bool
RolePolicyEnforcer::checkView(const RequestContext& ctx,
                              const PolicyTarget& target,
                              const std::string& action) const
{
    switch (ruleFor(action))
    {
    case PolicyRule::ANY:
        return true;
    case PolicyRule::ADMIN_ONLY:
        return ctx.isAdmin;
    case PolicyRule::ADMIN_OR_OWNER:
        return ctx.isAdmin || ctx.tenantId == target.tenantId;
    case PolicyRule::ADMIN_OR_NETWORK_OWNER:
        return ctx.isAdmin || ctx.tenantId == target.networkTenantId.value_or(target.tenantId);
    }
    return false;
}

void
RolePolicyEnforcer::enforceSet(const RequestContext& ctx,
                               const PolicyTarget& target,
                               const std::string& action) const
{
    if (!checkView(ctx, target, action))
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Tenant {} denied {} on resource of tenant {}",
                           ctx.tenantId,
                           action,
                           target.tenantId);
        throw NotAuthorized(action);
    }
}
