#include "WebWorker.hpp"
#include "log.hpp"
#include "resp/ResponseWriter.hpp"
#include <exception>

WebWorker::WebWorker(const ServerConfig &c) : cfg(c), resolver(c.root) {}

WorkerResult WebWorker::handle(ByteSource &in, ByteSink &out) {
    WorkerResult result;
    logMessage(INFO, "Handling connection...");

    try {
        RequestReader reader(in, cfg.maxLineLength);
        result.head = reader.readRequest();

        if (result.head.status == READ_TOO_LONG)
            result.resolution.reason = Resolution::REASON_MALFORMED;
        else
            result.resolution = resolver.resolve(result.head.requestLine);

        if (!result.resolution.found())
            logMessage(INFO, std::string("Resolved as missing: ") +
                                 reasonName(result.resolution.reason));

        resp::ResponseWriter writer(cfg);
        result.headerSent = writer.writeHeader(out, result.resolution);
        if (result.headerSent)
            result.bodySent = writer.writeBody(out, result.resolution);
    } catch (const std::exception &e) {
        logError("WebWorker::handle", std::string("Output error: ") + e.what());
    }

    if (!out.flush())
        logMessage(WARNING, "final flush failed");

    logMessage(INFO, "Done handling connection.");
    return result;
}
