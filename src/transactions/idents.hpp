#pragma once

#include <string>
#include <vector>
#include "codec/address.hpp"
#include "ledger/ledger_types.hpp"
#include "transactions/transaction_builder.hpp"
#include "types/type_tag.hpp"

namespace nexus::transactions {

// Module and function (or type) name of a Move entity.
struct MoveIdent {
    const char* module;
    const char* name;
};

namespace idents {

namespace dag {
constexpr MoveIdent kDag{"dag", "DAG"};
constexpr MoveIdent kDagExecution{"dag", "DAGExecution"};
constexpr MoveIdent kNew{"dag", "new"};
constexpr MoveIdent kWithVertex{"dag", "with_vertex"};
constexpr MoveIdent kWithDefaultValue{"dag", "with_default_value"};
constexpr MoveIdent kWithEdge{"dag", "with_edge"};
constexpr MoveIdent kWithEncryptedEdge{"dag", "with_encrypted_edge"};
constexpr MoveIdent kWithOutput{"dag", "with_output"};
constexpr MoveIdent kWithEncryptedOutput{"dag", "with_encrypted_output"};
constexpr MoveIdent kWithEntryPortInGroup{"dag", "with_entry_port_in_group"};
constexpr MoveIdent kNewDagExecutionConfig{"dag", "new_dag_execution_config"};
}  // namespace dag

namespace default_tap {
constexpr MoveIdent kBeginDagExecution{"default_tap", "begin_dag_execution"};
constexpr MoveIdent kBeginDagExecutionWitness{"default_tap", "BeginDagExecutionWitness"};
constexpr MoveIdent kDagBeginExecutionFromScheduler{"default_tap",
                                                    "dag_begin_execution_from_scheduler"};
constexpr MoveIdent kRegisterBeginExecution{"default_tap", "register_begin_execution"};
}  // namespace default_tap

namespace scheduler {
constexpr MoveIdent kTask{"scheduler", "Task"};
constexpr MoveIdent kNew{"scheduler", "new"};
constexpr MoveIdent kNewMetadata{"scheduler", "new_metadata"};
constexpr MoveIdent kUpdateMetadata{"scheduler", "update_metadata"};
constexpr MoveIdent kNewConstraintsPolicy{"scheduler", "new_constraints_policy"};
constexpr MoveIdent kNewExecutionPolicy{"scheduler", "new_execution_policy"};
constexpr MoveIdent kNewQueueGeneratorState{"scheduler", "new_queue_generator_state"};
constexpr MoveIdent kNewPeriodicGeneratorState{"scheduler", "new_periodic_generator_state"};
constexpr MoveIdent kRegisterQueueGenerator{"scheduler", "register_queue_generator"};
constexpr MoveIdent kRegisterPeriodicGenerator{"scheduler", "register_periodic_generator"};
constexpr MoveIdent kQueueGeneratorWitness{"scheduler", "QueueGeneratorWitness"};
constexpr MoveIdent kPeriodicGeneratorWitness{"scheduler", "PeriodicGeneratorWitness"};
constexpr MoveIdent kAddOccurrenceAbsolute{"scheduler", "add_occurrence_absolute_for_task"};
constexpr MoveIdent kAddOccurrenceWithOffset{"scheduler", "add_occurrence_with_offset_for_task"};
constexpr MoveIdent kAddOccurrenceRelative{"scheduler", "add_occurrence_relative_for_task"};
constexpr MoveIdent kNewOrModifyPeriodic{"scheduler", "new_or_modify_periodic_for_task"};
constexpr MoveIdent kDisablePeriodic{"scheduler", "disable_periodic_for_task"};
constexpr MoveIdent kPause{"scheduler", "pause_time_constraint_for_task"};
constexpr MoveIdent kResume{"scheduler", "resume_time_constraint_for_task"};
constexpr MoveIdent kCancel{"scheduler", "cancel_time_constraint_for_task"};
constexpr MoveIdent kCheckTimeConstraint{"scheduler", "check_time_constraint"};
}  // namespace scheduler

namespace tool_registry {
constexpr MoveIdent kOverTool{"tool_registry", "OverTool"};
constexpr MoveIdent kRegisterOffChainTool{"tool_registry", "register_off_chain_tool"};
constexpr MoveIdent kRegisterOnChainTool{"tool_registry", "register_on_chain_tool"};
constexpr MoveIdent kUnregisterTool{"tool_registry", "unregister_tool"};
constexpr MoveIdent kClaimCollateralForSelf{"tool_registry", "claim_collateral_for_self"};
}  // namespace tool_registry

namespace gas {
constexpr MoveIdent kOverGas{"gas", "OverGas"};
constexpr MoveIdent kAddGasBudget{"gas", "add_gas_budget"};
constexpr MoveIdent kDeescalate{"gas", "deescalate"};
constexpr MoveIdent kSetSingleInvocationCostMist{"gas", "set_single_invocation_cost_mist"};
constexpr MoveIdent kScopeInvokerAddress{"gas", "scope_invoker_address"};
}  // namespace gas

namespace gas_extension {
constexpr MoveIdent kEnableExpiry{"gas_extension", "enable_expiry"};
constexpr MoveIdent kDisableExpiry{"gas_extension", "disable_expiry"};
constexpr MoveIdent kBuyExpiryGasTicket{"gas_extension", "buy_expiry_gas_ticket"};
constexpr MoveIdent kEnableLimitedInvocations{"gas_extension", "enable_limited_invocations"};
constexpr MoveIdent kDisableLimitedInvocations{"gas_extension", "disable_limited_invocations"};
constexpr MoveIdent kBuyLimitedInvocationsGasTicket{"gas_extension",
                                                    "buy_limited_invocations_gas_ticket"};
}  // namespace gas_extension

namespace network_auth {
constexpr MoveIdent kCreateBinding{"network_auth", "create_binding"};
constexpr MoveIdent kNewProofOfKey{"network_auth", "new_proof_of_key"};
constexpr MoveIdent kProveLeader{"network_auth", "prove_leader"};
constexpr MoveIdent kProveOffchainTool{"network_auth", "prove_offchain_tool"};
constexpr MoveIdent kRegisterKey{"network_auth", "register_key"};
constexpr MoveIdent kKeyBinding{"network_auth", "KeyBinding"};
}  // namespace network_auth

namespace primitives {
constexpr MoveIdent kCloneableOwnerCap{"owner_cap", "CloneableOwnerCap"};
}  // namespace primitives

namespace framework {
constexpr MoveIdent kPublicShareObject{"transfer", "public_share_object"};
constexpr MoveIdent kPublicTransfer{"transfer", "public_transfer"};
constexpr MoveIdent kIntoBalance{"coin", "into_balance"};
constexpr MoveIdent kSui{"sui", "SUI"};
}  // namespace framework

}  // namespace idents

// `package::module::name<type_params>` as a type tag.
types::TypeTag struct_type(const codec::Address& package, MoveIdent ident,
                           std::vector<types::TypeTag> type_params = {});

// Move's TypeName rendering: 64 hex digits without the 0x prefix.
std::string type_name_string(const codec::Address& package, MoveIdent ident);

Argument call(TransactionBuilder& tx, const codec::Address& package, MoveIdent ident,
              std::vector<Argument> arguments, std::vector<types::TypeTag> type_arguments = {});

// The shared clock, immutable, initial version 1.
Argument clock_input(TransactionBuilder& tx);

Argument shared_input(TransactionBuilder& tx, const ledger::ObjectRef& ref, bool is_mutable);

// `0x2::transfer::public_share_object<T>(object)`.
Argument share_object(TransactionBuilder& tx, Argument object, types::TypeTag type);

// `0x2::transfer::public_transfer<T>(object, recipient)`.
Argument public_transfer(TransactionBuilder& tx, Argument object, types::TypeTag type,
                         const codec::Address& recipient);

// `CloneableOwnerCap<workflow::module::Over...>`.
types::TypeTag cloneable_owner_cap_type(const codec::Address& primitives_pkg,
                                        const codec::Address& workflow_pkg, MoveIdent over);

}  // namespace nexus::transactions
