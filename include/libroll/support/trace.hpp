#pragma once

/**
 * USDT (User Statically-Defined Tracing) probes for libroll.
 *
 * Probes are attached at runtime with bpftrace, systemtap or perf, e.g.
 *   sudo bpftrace -e 'usdt:./roll_demo:roll:lattice_complete { printf("%d\n", arg0); }'
 *
 * ROLL_HAVE_SDT is defined by the build when <sys/sdt.h> is available. Without
 * it every ROLL_TRACE_* macro expands to nothing and its arguments are not evaluated.
 */

#ifdef ROLL_HAVE_SDT
#include <sys/sdt.h>
#define ROLL_PROBE1(name, a1) DTRACE_PROBE1(roll, name, a1)
#define ROLL_PROBE2(name, a1, a2) DTRACE_PROBE2(roll, name, a1, a2)
#define ROLL_PROBE3(name, a1, a2, a3) DTRACE_PROBE3(roll, name, a1, a2, a3)
#else
#define ROLL_PROBE1(name, a1) ((void)0)
#define ROLL_PROBE2(name, a1, a2) ((void)0)
#define ROLL_PROBE3(name, a1, a2, a3) ((void)0)
#endif

/**
 * Module identifiers, passed as the first argument of the shared probes
 */
#define ROLL_MODULE_CLOSED_FORM   1
#define ROLL_MODULE_LATTICE       2
#define ROLL_MODULE_DECISION_TREE 3
#define ROLL_MODULE_SERVICE       4

/**
 * Fired when input validation or a numerical domain check fails
 * @param module_id: ROLL_MODULE_* constant
 * @param value: offending value (probability, volatility, step count)
 */
#define ROLL_TRACE_VALIDATION_ERROR(module_id, value) \
    ROLL_PROBE2(validation_error, module_id, value)

/**
 * Lattice pricing
 * @param steps: number of time steps
 * @param p: risk-neutral up probability
 * @param price: value at the root node
 * @param early_step: earliest optimal exercise step, -1 if none
 */
#define ROLL_TRACE_LATTICE_START(steps, p) \
    ROLL_PROBE2(lattice_start, steps, p)

#define ROLL_TRACE_LATTICE_COMPLETE(steps, price, early_step) \
    ROLL_PROBE3(lattice_complete, steps, price, early_step)

/**
 * Decision tree rollback
 * @param nodes: number of nodes visited
 * @param root_emv: expected monetary value at the root
 */
#define ROLL_TRACE_ROLLBACK_START(nodes) \
    ROLL_PROBE1(rollback_start, nodes)

#define ROLL_TRACE_ROLLBACK_COMPLETE(nodes, root_emv) \
    ROLL_PROBE2(rollback_complete, nodes, root_emv)

/**
 * Service request outcome
 * @param module_id: which engine served the request
 * @param success: 1 on success, 0 on a reported error
 */
#define ROLL_TRACE_REQUEST(module_id, success) \
    ROLL_PROBE2(request, module_id, success)
