// SPDX-License-Identifier: Apache-2.0
#include <admin/DlqAdmin.hpp>
#include <callscribe/Config.hpp>
#include <callscribe/Services.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <queue/JobQueue.hpp>

#include <CLI/CLI.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <print>

using namespace callscribe;

namespace
{

    auto printReply(Result<AdminReply> const& reply) -> int
    {
        if (!reply)
        {
            log::error("{}", reply.error());
            std::println("{}", json::serialize(nlohmann::json { { "status", "error" }, { "error", reply.error().message } }));
            return 1;
        }

        std::println("{}", json::serialize(reply->body, 2));
        return reply->exitCode;
    }

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "callscribe-admin: inspect and replay the transcription queue" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto redisHost = std::string {};
    auto redisPort = 0;
    auto keyPrefix = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--redis-host", redisHost, "Redis host");
    app.add_option("--redis-port", redisPort, "Redis port");
    app.add_option("--key-prefix", keyPrefix, "Queue key prefix");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // enqueue
    auto job = JobEnvelope {};
    auto language = std::string {};
    auto* enqueueCmd = app.add_subcommand("enqueue", "Enqueue a transcription job");
    enqueueCmd->add_option("--record-id", job.recordId, "Call record id")->required();
    enqueueCmd->add_option("--call-id", job.callId, "Call id")->required();
    enqueueCmd->add_option("--recording-url", job.recordingUrl, "Recording URL or local path")->required();
    enqueueCmd->add_option("--engine", job.engine, "STT engine")->default_val("stub");
    enqueueCmd->add_option("--language", language, "Language hint");

    // dlq
    auto audit = AuditContext {};
    auto entryId = std::string {};
    auto recordId = std::int64_t { 0 };
    auto* dlqCmd = app.add_subcommand("dlq", "Dead-letter queue commands");
    dlqCmd->require_subcommand(1);
    auto* listCmd = dlqCmd->add_subcommand("list", "List dead-lettered jobs");
    auto* requeueCmd = dlqCmd->add_subcommand("requeue", "Replay one dead-letter entry");
    requeueCmd->add_option("entry_id", entryId, "Entry id as printed by 'dlq list'")->required();
    auto* replayCmd = dlqCmd->add_subcommand("replay", "Replay the dead-letter entry of a call record");
    replayCmd->add_option("--record-id", recordId, "Call record id")->required();
    for (auto* cmd: { requeueCmd, replayCmd })
    {
        cmd->add_option("--actor", audit.actor, "Who requested the replay (audit log)");
        cmd->add_option("--reason", audit.reason, "Why the job is replayed (audit log)");
    }

    // stats
    auto* statsCmd = app.add_subcommand("stats", "Show queue sizes");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        log::setLevel(log::Level::Debug);

    auto configResult = configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (!redisHost.empty())
        config.store.host = redisHost;
    if (redisPort > 0)
        config.store.port = redisPort;
    if (!keyPrefix.empty())
        config.store.keyPrefix = keyPrefix;
    applyLogLevel(config, verbose);

    auto store = makeQueueStore(config.store);
    if (!store)
    {
        log::error("Cannot open queue store: {}", store.error());
        return 1;
    }

    auto queue = JobQueue(**store, QueueKeys::withPrefix(config.store.keyPrefix));
    auto admin = DlqAdmin(queue, makeRecordRepositoryFactory(config.records));

    if (enqueueCmd->parsed())
    {
        if (!language.empty())
            job.language = language;
        return printReply(admin.enqueue(job));
    }
    if (listCmd->parsed())
        return printReply(admin.list());
    if (requeueCmd->parsed())
        return printReply(admin.requeue(entryId, audit));
    if (replayCmd->parsed())
        return printReply(admin.replayRecord(recordId, audit));
    if (statsCmd->parsed())
        return printReply(admin.stats());

    std::cerr << app.help();
    return 1;
}
