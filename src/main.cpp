#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "hemascan/config.hpp"
#include "hemascan/device_identity.hpp"
#include "hemascan/diagnosis.hpp"
#include "hemascan/errors.hpp"
#include "hemascan/repository.hpp"
#include "hemascan/scheduler.hpp"
#include "hemascan/sync.hpp"
#include "hemascan/transport.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void printUsage(const char* executable) {
    std::cout << "Usage: " << executable << " [--config <path>] --image <file> [--scan-type conjunctiva|nail_bed]"
              << " [--roi <preset>] [--patient <id>] [--fatigue <1-10>] [--hemoglobin <g/dL>]"
              << " [--sob] [--dizzy] [--pale] [--compact]\n"
              << "Screens one image for anemia risk, stores the scan locally and prints the result as JSON."
              << std::endl;
    std::cout << "       " << executable << " [--config <path>] [--sync-once | --service | --pending] [--compact]\n"
              << "Runs one sync cycle, the periodic sync service, or prints the number of unsynced scans."
              << std::endl;
}

void signalHandler(int signal) {
    gSignalStatus = signal;
}

hemascan::Vitals parseVitalsArgs(const std::optional<std::string>& fatigue,
                                 const std::optional<std::string>& hemoglobin,
                                 bool sob, bool dizzy, bool pale) {
    hemascan::Vitals vitals;
    if (fatigue) {
        vitals.fatigue_level = std::stoi(*fatigue);
    }
    if (hemoglobin) {
        vitals.known_hemoglobin = std::stod(*hemoglobin);
    }
    vitals.shortness_of_breath = sob;
    vitals.dizziness = dizzy;
    vitals.pale_skin = pale;
    vitals.validate();
    return vitals;
}

hemascan::Json syncResultJson(const hemascan::SyncCycleResult& result, std::size_t pending) {
    hemascan::Json output = hemascan::makeObject();
    output["timestamp"] = hemascan::currentIsoTimestamp();
    output["outcome"] = hemascan::toString(result.outcome);
    output["record_count"] = result.record_count;
    output["retry"] = result.retry;
    if (!result.error.empty()) {
        output["error"] = result.error;
    }
    output["pending"] = pending;
    return output;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "hemascan.config.json";
    std::string imagePath;
    std::string scanTypeName = "conjunctiva";
    std::string roiName;
    std::string patientId = "anonymous";
    std::optional<std::string> fatigueArg;
    std::optional<std::string> hemoglobinArg;
    bool sob = false;
    bool dizzy = false;
    bool pale = false;
    bool prettyPrint = true;
    bool syncOnce = false;
    bool runService = false;
    bool showPending = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--image" && i + 1 < argc) {
            imagePath = argv[++i];
        } else if (arg == "--scan-type" && i + 1 < argc) {
            scanTypeName = argv[++i];
        } else if (arg == "--roi" && i + 1 < argc) {
            roiName = argv[++i];
        } else if (arg == "--patient" && i + 1 < argc) {
            patientId = argv[++i];
        } else if (arg == "--fatigue" && i + 1 < argc) {
            fatigueArg = argv[++i];
        } else if (arg == "--hemoglobin" && i + 1 < argc) {
            hemoglobinArg = argv[++i];
        } else if (arg == "--sob") {
            sob = true;
        } else if (arg == "--dizzy") {
            dizzy = true;
        } else if (arg == "--pale") {
            pale = true;
        } else if (arg == "--compact") {
            prettyPrint = false;
        } else if (arg == "--sync-once") {
            syncOnce = true;
        } else if (arg == "--service") {
            runService = true;
        } else if (arg == "--pending") {
            showPending = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (imagePath.empty() && !syncOnce && !runService && !showPending) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        hemascan::AppConfig config = hemascan::loadConfig(configPath);
        hemascan::JsonFileScanRepository store(config.storage.scan_store_path);
        const int indent = prettyPrint ? 2 : -1;

        if (!imagePath.empty()) {
            hemascan::ScanType scanType = hemascan::scanTypeFromString(scanTypeName);
            hemascan::RegionOfInterest roi = config.analysis.roi;
            if (!roiName.empty()) {
                roi = hemascan::RegionOfInterest::fromPreset(roiName);
            } else if (scanType == hemascan::ScanType::NAIL_BED && config.analysis.roi_preset == "lower_eyelid") {
                roi = hemascan::RegionOfInterest::centerRegion();
            }
            hemascan::Vitals vitals = parseVitalsArgs(fatigueArg, hemoglobinArg, sob, dizzy, pale);

            hemascan::ColorFeatureExtractor extractor(config.model.input_size);
            hemascan::RiskInferenceEngine engine(hemascan::loadModelBackend(config.model.path));
            hemascan::DiagnosisService service(extractor, engine, &store);

            hemascan::DiagnosisResult result = service.runDiagnosis(
                hemascan::loadRasterFromFile(imagePath), roi, patientId, scanType, vitals, imagePath);
            engine.release();

            hemascan::Json output = hemascan::makeObject();
            output["timestamp"] = hemascan::currentIsoTimestamp();
            output["scan_type"] = hemascan::toString(scanType);
            output["result"] = hemascan::toJson(result);
            output["pending"] = store.countByStatus(hemascan::SyncStatus::PENDING) +
                                store.countByStatus(hemascan::SyncStatus::FAILED);
            std::cout << output.dump(indent) << std::endl;
            if (!syncOnce && !runService) {
                return 0;
            }
        }

        if (showPending && !syncOnce && !runService) {
            hemascan::Json output = hemascan::makeObject();
            output["pending"] = store.countByStatus(hemascan::SyncStatus::PENDING) +
                                store.countByStatus(hemascan::SyncStatus::FAILED);
            std::cout << output.dump(indent) << std::endl;
            return 0;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        hemascan::DeviceIdentity identity = hemascan::DeviceIdentity::loadOrCreate(config.sync.device_id_path);
        hemascan::MqttTransport transport(config.mqtt);
        hemascan::SyncQueueManager queue(store, transport, identity.id());
        hemascan::SyncScheduler scheduler(queue, std::chrono::seconds(config.sync.interval_sec),
                                          []() { return gSignalStatus == 0; });

        if (syncOnce) {
            hemascan::SyncCycleResult result = scheduler.runOnce();
            std::cout << syncResultJson(result, queue.pendingCount()).dump(indent) << std::endl;
            return result.outcome == hemascan::SyncCycleResult::Outcome::Failed ? 2 : 0;
        }

        std::cout << "[SYNC] Device " << identity.id() << ", " << queue.pendingCount() << " scans pending"
                  << std::endl;
        scheduler.start();
        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        scheduler.stop();
        std::cout << "[SYNC] Shutting down, " << queue.pendingCount() << " scans pending" << std::endl;
    } catch (const hemascan::PersistenceError& ex) {
        std::cerr << "Scan store error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
