#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/check.hpp"
#include "judge/grader.hpp"
#include "judge/intake.hpp"
#include "judge/script_evaluator.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/process_sandbox.hpp"
using namespace std;

static atomic<bool> stop_requested{false};

void sigintHandler(int /* signum */) {
    stop_requested = true;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    signal(SIGINT, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("path,p", po::value<string>()->default_value("."), "directory containing the submissions to be graded")
        ("tests-path,t", po::value<string>()->default_value("./tests"), "directory containing the checks")
        ("output-path,o", po::value<string>()->default_value("."), "directory to write final_grades.csv and final_grades.json into")
        ("json,j", po::value<string>(), "JSON metadata file mapping submission filenames to identifiers")
        ("yaml,y", po::value<string>(), "YAML metadata file mapping submission filenames to identifiers")
        ("scripts,s", "grade .py scripts instead of .ipynb notebooks")
        ("files,f", po::value<vector<string>>()->multitoken(), "support files copied beside the submission in every sandbox, e.g. utilities and data files")
        ("seed", po::value<long>(), "random seed passed to the evaluator as environ GRADER_SEED")
        ("evaluator", po::value<string>(), "command that runs the checks inside the sandbox, default to image/evaluate. You can either pass it from environ GRADER_EVALUATOR")
        ("image", po::value<string>(), "set the evaluator image directory copied into every sandbox. You can either pass it from environ EXECDIR")
        ("run-dir", po::value<string>(), "set the directory to create sandboxes in. You can either pass it from environ RUNDIR")
        ("containers", po::value<unsigned>(), "number of submissions graded in parallel, default to 4. You can either pass it from environ GRADER_CONTAINERS")
        ("timeout", po::value<double>(), "wall time limit in seconds for grading one submission, default to 600. You can either pass it from environ GRADER_TIMEOUT")
        ("max-retries", po::value<unsigned>(), "times a submission is retried after environment errors, default to 1. You can either pass it from environ GRADER_MAX_RETRIES")
        ("batch-timeout", po::value<double>(), "wall time limit in seconds for the whole batch, unlimited by default")
        ("memory-limit", po::value<long>(), "memory limit in KB for the evaluator, default to 2097152(2GB). You can either pass it from environ GRADER_MEMLIMIT")
        ("cpu-time-limit", po::value<double>(), "cpu time limit in seconds for the evaluator, unlimited by default")
        ("file-limit", po::value<long>(), "file size limit in KB for the evaluator, default to 524288(512MB). You can either pass it from environ GRADER_FILELIMIT")
        ("proc-limit", po::value<int>(), "process limit for the evaluator, unlimited by default")
        ("run-user", po::value<string>(), "user name or uid the first sandbox runs as, default to 60000. Sandbox i runs as uid + i. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "group name or gid the first sandbox runs as, default to the uid of run user. Sandbox i runs as gid + i. You can either pass it from environ RUNGROUP")
        ("no-isolation", "run sandboxes as the current user, without a separate user per sandbox")
        ("no-kill", "keep sandbox directories after grading")
        ("no-partial-timeout-credit", "give zero score to timed out submissions instead of keeping checks passed before the timeout")
        ("skip-invalid", "skip invalid submissions instead of aborting")
        ("verbose,v", "print progress to stderr")
        ("debug", "turn on the debug mode to log evaluator stdout and stderr")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: grade a batch of submissions in parallel sandboxes" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("json") && vm.count("yaml")) {
        cerr << "--json and --yaml should not be used together" << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("verbose")) {
        FLAGS_logtostderr = true;
        FLAGS_v = 1;
    } else {
        FLAGS_stderrthreshold = google::GLOG_WARNING;
    }

    if (vm.count("debug")) {
        grader::DEBUG = true;
    } else if (getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    if (vm.count("image")) {
        grader::EXEC_DIR = filesystem::path(vm.at("image").as<string>());
    } else if (getenv("EXECDIR")) {
        grader::EXEC_DIR = filesystem::path(getenv("EXECDIR"));
    } else {
        filesystem::path execdir(repo_dir / "exec");
        if (filesystem::exists(execdir)) {
            grader::EXEC_DIR = execdir;
        }
    }
    CHECK(filesystem::is_directory(grader::EXEC_DIR))
        << "Evaluator image directory " << grader::EXEC_DIR << " does not exist";

    try {
        for (auto& p : filesystem::directory_iterator(grader::EXEC_DIR))
            if (filesystem::is_regular_file(p))
                filesystem::permissions(p,
                                        filesystem::perms::group_exec | filesystem::perms::others_exec | filesystem::perms::owner_exec,
                                        filesystem::perm_options::add);
    } catch (filesystem::filesystem_error& ex) {
        LOG(ERROR) << "Unable to prepare evaluator image " << grader::EXEC_DIR << ": " << ex.what();
        cerr << "Unable to prepare evaluator image " << grader::EXEC_DIR << ": " << ex.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("run-dir")) {
        grader::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        grader::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    } else {
        grader::RUN_DIR = filesystem::temp_directory_path() / "grader";
    }
    try {
        filesystem::create_directories(grader::RUN_DIR);
    } catch (filesystem::filesystem_error& ex) {
        LOG(ERROR) << "Unable to create run directory " << grader::RUN_DIR << ": " << ex.what();
        cerr << "Unable to create run directory " << grader::RUN_DIR << ": " << ex.what() << endl;
        return EXIT_FAILURE;
    }

    grader::process_sandbox_options sandbox_options;
    sandbox_options.isolate = !vm.count("no-isolation");
    sandbox_options.keep_dirs = vm.count("no-kill") > 0;
    if (sandbox_options.isolate) {
        if (geteuid() != 0) {
            cerr << "Grading with a separate user per sandbox requires root privileges, use --no-isolation to run sandboxes as the current user" << endl;
            return EXIT_FAILURE;
        }

        string run_user = vm.count("run-user") ? vm.at("run-user").as<string>() : grader::get_env("RUNUSER", "60000");
        string run_group;
        long uid = -1, gid = -1;
        try {
            uid = grader::get_userid(run_user);
            run_group = vm.count("run-group") ? vm.at("run-group").as<string>() : grader::get_env("RUNGROUP", to_string(uid));
            gid = grader::get_groupid(run_group);
        } catch (boost::bad_lexical_cast& e) {
            cerr << "Invalid run user or run group: " << e.what() << endl;
            return EXIT_FAILURE;
        }
        if (uid <= 0 || gid <= 0) {
            cerr << "Run user " << run_user << " and run group " << run_group << " should exist and should not be root" << endl;
            return EXIT_FAILURE;
        }
        sandbox_options.run_uid = (uid_t)uid;
        sandbox_options.run_gid = (gid_t)gid;
    }

    grader::grade_options options;
    vector<string> command;
    try {
        if (vm.count("timeout")) {
            grader::DEFAULT_TIMEOUT = vm.at("timeout").as<double>();
        } else {
            grader::DEFAULT_TIMEOUT = grader::get_env_as<double>("GRADER_TIMEOUT", grader::DEFAULT_TIMEOUT);
        }

        if (vm.count("memory-limit")) {
            grader::DEFAULT_MEM_LIMIT = vm.at("memory-limit").as<long>();
        } else {
            grader::DEFAULT_MEM_LIMIT = grader::get_env_as<long>("GRADER_MEMLIMIT", grader::DEFAULT_MEM_LIMIT);
        }

        if (vm.count("file-limit")) {
            grader::DEFAULT_FILE_LIMIT = vm.at("file-limit").as<long>();
        } else {
            grader::DEFAULT_FILE_LIMIT = grader::get_env_as<long>("GRADER_FILELIMIT", grader::DEFAULT_FILE_LIMIT);
        }

        if (vm.count("containers")) {
            options.concurrency = vm.at("containers").as<unsigned>();
        } else {
            options.concurrency = grader::get_env_as<unsigned>("GRADER_CONTAINERS", 4);
        }

        if (vm.count("max-retries")) {
            options.max_retries = vm.at("max-retries").as<unsigned>();
        } else {
            options.max_retries = grader::get_env_as<unsigned>("GRADER_MAX_RETRIES", options.max_retries);
        }

        string evaluator = vm.count("evaluator") ? vm.at("evaluator").as<string>()
                                                 : grader::get_env("GRADER_EVALUATOR", "image/evaluate");
        boost::trim(evaluator);
        boost::split(command, evaluator, boost::is_any_of(" \t"), boost::token_compress_on);
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Invalid environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (options.concurrency == 0 || command.empty() || command[0].empty()) {
        cerr << "--containers should be at least 1 and --evaluator should not be empty" << endl;
        return EXIT_FAILURE;
    }

    options.per_job_timeout = grader::DEFAULT_TIMEOUT;
    options.limits.memory_limit = grader::DEFAULT_MEM_LIMIT;
    options.limits.file_limit = grader::DEFAULT_FILE_LIMIT;
    if (vm.count("cpu-time-limit")) options.limits.cpu_time = vm.at("cpu-time-limit").as<double>();
    if (vm.count("proc-limit")) options.limits.proc_limit = vm.at("proc-limit").as<int>();
    if (vm.count("batch-timeout")) options.batch_timeout = vm.at("batch-timeout").as<double>();
    options.timeout_partial_credit = !vm.count("no-partial-timeout-credit");
    options.stop = &stop_requested;

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    shared_ptr<const grader::check_set> checks;
    vector<grader::submission_job> jobs;
    try {
        checks = make_shared<const grader::check_set>(grader::check_set::load(vm.at("tests-path").as<string>()));

        map<string, string> metadata;
        if (vm.count("json"))
            metadata = grader::load_metadata(vm.at("json").as<string>());
        else if (vm.count("yaml"))
            metadata = grader::load_yaml_metadata(vm.at("yaml").as<string>());

        if (vm.count("files"))
            for (auto& file : vm.at("files").as<vector<string>>()) {
                if (!filesystem::is_regular_file(file))
                    throw grader::intake_error(file, "support file does not exist");
                options.support_files.push_back(filesystem::absolute(file));
            }

        vector<string> extensions = {vm.count("scripts") ? ".py" : ".ipynb"};
        auto refs = grader::list_submissions(vm.at("path").as<string>(), extensions);

        vector<grader::intake_rejection> rejected;
        jobs = grader::normalize_submissions(refs, checks, metadata, vm.count("skip-invalid") ? &rejected : nullptr);
        for (auto& rejection : rejected)
            cerr << "Skipped " << rejection.reference << ": " << rejection.reason << endl;
    } catch (grader::intake_error& ex) {
        LOG(ERROR) << "Invalid submission " << ex.reference << ": " << ex.what();
        cerr << ex.reference << ": " << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (filesystem::filesystem_error& ex) {
        LOG(ERROR) << "Unable to read submissions: " << ex.what();
        cerr << "Unable to read submissions: " << ex.what() << endl;
        return EXIT_FAILURE;
    }

    sandbox_options.run_dir = grader::RUN_DIR;
    sandbox_options.image = grader::EXEC_DIR;
    sandbox_options.capacity = (int)options.concurrency;
    sandbox_options.min_free_space = grader::MIN_FREE_SPACE;
    grader::process_sandbox_provider provider(sandbox_options);
    map<string, string> evaluator_env;
    if (vm.count("seed")) evaluator_env["GRADER_SEED"] = to_string(vm.at("seed").as<long>());
    grader::script_evaluator evaluator(command, evaluator_env);

    grader::monitor_list monitors = {make_shared<grader::log_monitor>()};
    filesystem::path output_path = vm.at("output-path").as<string>();

    grader::grade_report report;
    int exitcode = EXIT_SUCCESS;
    try {
        report = grader::grade(jobs, *checks, provider, evaluator, options, monitors);
    } catch (grader::fatal_batch_error& ex) {
        LOG(ERROR) << "Batch aborted: " << ex.what();
        cerr << "Batch aborted: " << ex.what() << ", partial results are written" << endl;
        report = ex.report;
        exitcode = 2;
    }

    try {
        grader::write_report(output_path, report);
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to write report: " << ex.what();
        cerr << "Unable to write report: " << ex.what() << endl;
        return 2;
    }

    double sum = 0;
    for (auto& row : report.rows) sum += row.total;
    cout << fmt::format("Graded {} submissions, average score {:.2f} / {:g}",
                        report.rows.size(), report.rows.empty() ? 0.0 : sum / report.rows.size(), report.possible())
         << endl;

    return exitcode;
}
