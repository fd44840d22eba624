#pragma once

/**
 * @file cli.h
 * @brief Command-line entry point for the cinder binary.
 */

namespace cinder::cli
{

/** @brief Run the CLI using argc/argv; returns process exit code. */
int run(int argc, char** argv);

} // namespace cinder::cli
