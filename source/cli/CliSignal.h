#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C handling for long-running CLI commands.
 *
 * `quire listen` runs until the book ends. SIGINT/SIGTERM (CTRL_C_EVENT on
 * Windows) only set a flag; the command polls it, stops playback at the next
 * line boundary and still saves the position and prints its summary.
 */

namespace Cli {

/**
 * @brief Install the interrupt handlers. Call once at CLI startup.
 */
void installSignalHandlers();

/**
 * @brief Check if an interrupt was received.
 */
bool wasCancelled();

} // namespace Cli

#endif // CLISIGNAL_H
