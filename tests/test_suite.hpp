#pragma once

#include <iostream>

// Fails the enclosing `bool` test with the location of the broken expectation.
#define TFWRAP_CHECK(cond)                                                                                            \
    do {                                                                                                              \
        if (!(cond)) {                                                                                                \
            std::cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #cond << std::endl;                       \
            return false;                                                                                             \
        }                                                                                                             \
    } while (0)

// graph_test.cpp
bool graph_topo_order_test();
bool graph_cycle_reports_path_test();
bool graph_self_dependency_test();
bool graph_union_test();
bool graph_reachability_test();

// builder_test.cpp
bool scanner_classifies_symlinks_test();
bool builder_depends_on_test();
bool builder_no_metadata_test();
bool builder_missing_dependency_test();
bool builder_cycle_test();
bool builder_module_edges_test();
bool symlink_reconciliation_test();
bool symlink_without_target_node_test();
bool symlink_cycle_dropped_test();
bool scanner_listing_errors_test();

// executor_test.cpp
bool executor_failure_propagation_test();
bool executor_independent_nodes_test();
bool executor_post_set_runs_after_failure_test();
bool executor_concurrency_bound_test();
bool executor_prepare_failure_test();
bool executor_diff_is_not_failure_test();
bool executor_dry_run_test();
bool executor_transitive_skip_test();
bool executor_symlink_after_target_test();
bool executor_running_status_test();
bool executor_dot_escaping_test();

// change_impact_test.cpp
bool impact_file_change_test();
bool impact_module_change_test();
bool impact_auto_vars_test();
bool impact_symlinked_directory_test();
bool impact_opt_out_and_scope_test();
bool impact_monotonic_test();
bool impact_deleted_file_test();

// config_test.cpp
bool config_merge_precedence_test();
bool config_depends_on_not_inherited_test();
bool config_envvar_unset_test();
bool config_invalid_test();
bool config_resolve_envvars_test();

// pipeline_test.cpp
bool pipeline_manifest_parse_test();
bool pipeline_check_test();
bool backend_check_test();

// process_test.cpp
bool process_exec_output_test();
bool process_exec_env_and_cwd_test();
bool process_exec_stdin_test();
bool process_audit_post_test();
bool process_exec_missing_binary_test();
bool process_retriable_errors_test();
bool cli_arguments_test();
bool cli_parse_positive_int_test();

// terraform_test.cpp
bool terraform_classify_exit_test();
bool terraform_parse_version_test();
bool terraform_commands_test();
bool terraform_snapshot_directory_test();
bool plan_scan_text_test();
bool plan_scan_json_test();
bool source_analysis_test();
