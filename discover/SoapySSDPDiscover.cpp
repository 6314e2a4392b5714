// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SoapySSDPSession.hpp"
#include "SoapySSDPSearchConfig.hpp"
#include "SoapySSDPDefs.hpp"
#include "SoapyInfoUtils.hpp"
#include <SoapySDR/Logger.hpp>
#include <SoapySDR/Types.hpp>
#include <cstdlib>
#include <cstddef>
#include <iostream>
#include <getopt.h>
#include <csignal>

/***********************************************************************
 * Print help message
 **********************************************************************/
static int printHelp(void)
{
    std::cout << "Usage SoapySSDPDiscover [options]" << std::endl;
    std::cout << "  Options summary:" << std::endl;
    std::cout << "    -h, --help \t\t\t\t Print this help message" << std::endl;
    std::cout << "    -st, --search_target <ST> \t\t SSDP search target (default " SOAPY_SSDP_DEFAULT_ST ")" << std::endl;
    std::cout << "    -mx, --max_wait <seconds> \t\t Maximum reply delay for devices (default " << SOAPY_SSDP_DEFAULT_MX << ")" << std::endl;
    std::cout << "    --mx_limit <seconds> \t\t Largest accepted max wait (default " << SOAPY_SSDP_MX_MAX << ")" << std::endl;
    std::cout << "    -t, --timeout <seconds> \t\t Listen time after each probe (default mx + 1)" << std::endl;
    std::cout << "    -r, --retries <count> \t\t Additional probe rounds (default " << SOAPY_SSDP_DEFAULT_RETRIES << ")" << std::endl;
    std::cout << "    -v, --verbose \t\t\t Print parse diagnostics and all reply headers" << std::endl;
    std::cout << "    --ipver <4|6> \t\t\t Multicast group IP version (default 4)" << std::endl;
    std::cout << "    --iface <name|addr> \t\t Multicast send interface" << std::endl;
    std::cout << "    --ttl <hops> \t\t\t Multicast time to live (default " << SOAPY_SSDP_DEFAULT_TTL << ")" << std::endl;
    std::cout << "    --args <key=value,...> \t\t Search arguments in markup form" << std::endl;
    std::cout << std::endl;
    return EXIT_SUCCESS;
}

/***********************************************************************
 * Signal handler for Ctrl + C
 **********************************************************************/
static SoapySSDPSession *activeSession = nullptr;
void sigIntHandler(const int)
{
    if (activeSession != nullptr) activeSession->cancel();
}

/***********************************************************************
 * Print the discovered services
 **********************************************************************/
static void printRecord(const SoapySSDPRecord &record, const bool verbose)
{
    std::cout << record.getServiceType() << " " << record.getLocation() << std::endl;
    if (not verbose) return;

    std::cout << "    USN: " << record.getUSN() << std::endl;
    if (not record.getServer().empty()) std::cout << "    Server: " << record.getServer() << std::endl;
    if (record.hasCacheControl()) std::cout << "    Max-age: " << record.getCacheControl() << "s" << std::endl;
    std::cout << "    Source: " << record.getSourceAddress() << std::endl;
    for (const auto &pair : record.getHeaders())
    {
        std::cout << "    " << pair.first << " => " << pair.second << std::endl;
    }
}

/***********************************************************************
 * Run the discovery
 **********************************************************************/
static int runDiscovery(const SoapySDR::Kwargs &args)
{
    SoapySSDPSearchConfig config;
    try
    {
        config = SoapySSDPSearchConfig::fromKwargs(args);
        config.validate();
    }
    catch (const SoapySSDPInvalidConfig &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    SoapySDR::setLogLevel(config.verbose?SOAPY_SDR_DEBUG:SOAPY_SDR_WARNING);

    std::vector<SoapySSDPRecord> records;
    try
    {
        SoapySSDPSession session(config);
        activeSession = &session;
        signal(SIGINT, sigIntHandler);
        records = session.discover();
        signal(SIGINT, SIG_DFL);
        activeSession = nullptr;

        if (config.verbose) std::cout << "Rounds: " << session.getStats().rounds
            << ", replies: " << session.getStats().datagrams
            << ", malformed: " << session.getStats().malformed
            << ", duplicates: " << session.getStats().duplicates
            << ", send failures: " << session.getStats().sendFailures << std::endl;
    }
    catch (const SoapySSDPError &ex)
    {
        signal(SIGINT, SIG_DFL);
        activeSession = nullptr;
        std::cerr << "Discovery FAIL: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Found " << records.size() << " service(s) for " << config.searchTarget << std::endl;
    for (const auto &record : records) printRecord(record, config.verbose);
    return EXIT_SUCCESS;
}

/***********************************************************************
 * Parse and dispatch options
 **********************************************************************/
int main(int argc, char *argv[])
{
    /*******************************************************************
     * parse command line options
     ******************************************************************/
    static struct option long_options[] = {
        {"help", no_argument, 0, 'h'},
        {"h", no_argument, 0, 'h'},
        {"search_target", required_argument, 0, 's'},
        {"st", required_argument, 0, 's'},
        {"max_wait", required_argument, 0, 'm'},
        {"mx", required_argument, 0, 'm'},
        {"mx_limit", required_argument, 0, 'x'},
        {"timeout", required_argument, 0, 't'},
        {"t", required_argument, 0, 't'},
        {"retries", required_argument, 0, 'r'},
        {"r", required_argument, 0, 'r'},
        {"verbose", no_argument, 0, 'v'},
        {"v", no_argument, 0, 'v'},
        {"ipver", required_argument, 0, 'i'},
        {"iface", required_argument, 0, 'f'},
        {"ttl", required_argument, 0, 'l'},
        {"args", required_argument, 0, 'a'},
        {0, 0, 0,  0}
    };

    SoapySDR::Kwargs args;
    int long_index = 0;
    int option = 0;
    while ((option = getopt_long_only(argc, argv, "", long_options, &long_index)) != -1)
    {
        switch (option)
        {
        case 'h': return printHelp();
        case 's': args[SOAPY_SSDP_KWARG_ST] = optarg; break;
        case 'm': args[SOAPY_SSDP_KWARG_MX] = optarg; break;
        case 'x': args[SOAPY_SSDP_KWARG_MX_LIMIT] = optarg; break;
        case 't': args[SOAPY_SSDP_KWARG_TIMEOUT] = optarg; break;
        case 'r': args[SOAPY_SSDP_KWARG_RETRIES] = optarg; break;
        case 'v': args[SOAPY_SSDP_KWARG_VERBOSE] = "true"; break;
        case 'i': args[SOAPY_SSDP_KWARG_IPVER] = optarg; break;
        case 'f': args[SOAPY_SSDP_KWARG_IFACE] = optarg; break;
        case 'l': args[SOAPY_SSDP_KWARG_TTL] = optarg; break;
        case 'a':
            for (const auto &pair : SoapySDR::KwargsFromString(optarg)) args[pair.first] = pair.second;
            break;
        default:
            //unknown option, do help...
            printHelp();
            return EXIT_FAILURE;
        }
    }

    std::cout << "SoapySSDP discover " << SoapyInfo::getVersion() << std::endl;
    return runDiscovery(args);
}
